#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "logging/log.hpp"
#include "resources/app_driver.hpp"
#include "resources/resource_sync_worker.hpp"
#include "retry/errors.hpp"
#include "retry/policy.hpp"

namespace core {

namespace net = boost::asio;

// How RunAll waits for the resource sync thread once the session workflows
// are done.
// - poll: check liveness every poll_interval, logging a waiting line each
//   time (coarse; adds up to one interval of latency)
// - signal: the worker's finished callback posts a wake-up to the reactor
enum class JoinMode { poll, signal };

struct OrchestratorOptions {
  resources::SyncOptions sync;
  std::chrono::milliseconds poll_interval{1000};
  JoinMode join = JoinMode::poll;
};

using SessionWorkflow = std::function<void(net::yield_context)>;

// Orchestrator
// Threading model:
// - RunAll() is a coroutine on the reactor; it starts the resource sync
//   thread, runs all session workflows as concurrent coroutines on the same
//   reactor, then waits for the sync thread without blocking the reactor
// - The only state crossing threads is the worker's stop signal and liveness
//   flag
// - RequestStop() may be called from any thread. Stop() blocks until the sync
//   thread exits, so it must not be called on the reactor thread
class Orchestrator {
public:
  static constexpr const char *kComponent = "orchestrator";

  Orchestrator(net::io_context &ioc, resources::IApplicationDriver &driver,
               OrchestratorOptions options = {},
               resources::ExistsFn exists = resources::FileExists)
      : ioc_(ioc), driver_(driver), options_(std::move(options)),
        exists_(std::move(exists)) {}

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  ~Orchestrator() { Stop(); }

  // Rethrows the first workflow failure after everything has finished.
  resources::SyncReport RunAll(std::vector<std::string> resourcePaths,
                               std::vector<SessionWorkflow> workflows,
                               net::yield_context yield) {
    auto worker = std::make_shared<resources::ResourceSyncWorker>(
        std::move(resourcePaths), driver_, options_.sync, exists_);
    auto finished = std::make_shared<net::steady_timer>(
        ioc_, net::steady_timer::time_point::max());
    if (options_.join == JoinMode::signal) {
      worker->OnFinished([finished] {
        net::post(finished->get_executor(), [finished] { finished->cancel(); });
      });
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      worker_ = worker;
      if (stop_requested_) {
        worker->RequestStop();
      }
    }

    worker->Start();
    std::exception_ptr failure = Gather(std::move(workflows), yield);
    AwaitWorker(*worker, *finished, yield);
    worker->Join();
    RESYNC_LOG_INFO(kComponent, "all tasks completed");

    if (failure) {
      std::rethrow_exception(failure);
    }
    return worker->Report();
  }

  void RequestStop() {
    auto worker = CurrentWorker(true);
    if (worker) {
      worker->RequestStop();
    }
  }

  // Sets the stop signal and joins the sync thread. Idempotent.
  void Stop() {
    auto worker = CurrentWorker(true);
    if (worker) {
      worker->Stop();
    }
  }

private:
  std::shared_ptr<resources::ResourceSyncWorker> CurrentWorker(bool stopping) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping) {
      stop_requested_ = true;
    }
    return worker_;
  }

  // Runs every workflow as its own coroutine and waits for all of them.
  std::exception_ptr Gather(std::vector<SessionWorkflow> workflows,
                            net::yield_context yield) {
    if (workflows.empty()) {
      return nullptr;
    }
    struct GatherState {
      explicit GatherState(net::io_context &ioc, std::size_t n)
          : done(ioc, net::steady_timer::time_point::max()), remaining(n) {}
      net::steady_timer done;
      std::size_t remaining;
      std::exception_ptr first_failure;
    };
    auto state = std::make_shared<GatherState>(ioc_, workflows.size());
    for (auto &wf : workflows) {
      net::spawn(ioc_, [state, wf = std::move(wf)](net::yield_context y) {
        try {
          wf(y);
        } catch (...) {
          if (!state->first_failure) {
            state->first_failure = std::current_exception();
          }
          RESYNC_LOG_ERROR(kComponent,
                           "session workflow failed: "
                               << retry::Describe(std::current_exception()));
        }
        if (--state->remaining == 0) {
          state->done.cancel();
        }
      });
    }
    while (state->remaining > 0) {
      boost::system::error_code ec;
      state->done.async_wait(yield[ec]);
    }
    return state->first_failure;
  }

  void AwaitWorker(const resources::ResourceSyncWorker &worker,
                   net::steady_timer &finished, net::yield_context yield) {
    if (options_.join == JoinMode::signal) {
      while (worker.IsRunning()) {
        boost::system::error_code ec;
        finished.async_wait(yield[ec]);
      }
      return;
    }
    while (worker.IsRunning()) {
      RESYNC_LOG_INFO(kComponent, "waiting for resource sync to finish...");
      retry::WaitAsync(ioc_, yield, options_.poll_interval);
    }
  }

  net::io_context &ioc_;
  resources::IApplicationDriver &driver_;
  OrchestratorOptions options_;
  resources::ExistsFn exists_;

  std::mutex mutex_;
  std::shared_ptr<resources::ResourceSyncWorker> worker_;
  bool stop_requested_ = false;
};

} // namespace core
