#pragma once

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "logging/log.hpp"
#include "resources/app_driver.hpp"
#include "retry/policy.hpp"

namespace resources {

struct SyncOptions {
  int max_retries = 5;
  std::chrono::milliseconds retry_delay{2000};
  // Fixed wait after triggering a refresh; completion is not polled.
  std::chrono::milliseconds refresh_interval{5000};
  bool hidden = true;
};

enum class Outcome { not_started, synced, skipped_missing, abandoned };

inline const char *OutcomeName(Outcome o) {
  switch (o) {
  case Outcome::not_started:
    return "not_started";
  case Outcome::synced:
    return "synced";
  case Outcome::skipped_missing:
    return "skipped_missing";
  case Outcome::abandoned:
    return "abandoned";
  }
  return "unknown";
}

struct ResourceResult {
  std::string path;
  Outcome outcome = Outcome::not_started;
  int attempts = 0;
};

struct SyncReport {
  std::vector<ResourceResult> resources;
  int launches = 0;
  int teardowns = 0;
  bool stopped = false;

  std::size_t Count(Outcome o) const {
    std::size_t n = 0;
    for (const auto &r : resources) {
      if (r.outcome == o) {
        ++n;
      }
    }
    return n;
  }
};

using Status = std::expected<void, std::string>;

// ResourceSyncWorker
// Threading model:
// - Run() executes on one dedicated std::jthread (Start) and owns the only
//   live ApplicationHandle; nothing else touches the handle
// - The stop signal is a std::stop_source owned by the worker: set once from
//   any thread, checked between resources only, never cleared. A resource
//   that is mid-refresh always runs to the end of its attempt
// - IsRunning() is the liveness flag; the finished callback (if any) runs on
//   the worker thread after the last teardown
// Per resource: open -> refresh -> fixed wait -> save -> close, retried up to
// max_retries times on the same application. When the attempts run out the
// resource is abandoned and the application is torn down and constructed
// again before the next resource.
class ResourceSyncWorker {
public:
  static constexpr const char *kComponent = "resource_sync";

  ResourceSyncWorker(std::vector<std::string> paths,
                     IApplicationDriver &driver, SyncOptions options = {},
                     ExistsFn exists = FileExists)
      : paths_(std::move(paths)), driver_(driver),
        options_(std::move(options)), exists_(std::move(exists)) {}

  ~ResourceSyncWorker() { Stop(); }

  ResourceSyncWorker(const ResourceSyncWorker &) = delete;
  ResourceSyncWorker &operator=(const ResourceSyncWorker &) = delete;

  // Must be called before Start().
  void OnFinished(std::function<void()> callback) {
    on_finished_ = std::move(callback);
  }

  void Start() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
      RESYNC_LOG_WARN(kComponent, "resource sync thread already started");
      return;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::jthread([this] {
      report_ = Run(stop_.get_token());
      running_.store(false, std::memory_order_release);
      if (on_finished_) {
        on_finished_();
      }
    });
    RESYNC_LOG_INFO(kComponent, "resource sync thread started");
  }

  // Sets the stop signal without waiting.
  void RequestStop() { stop_.request_stop(); }

  // Sets the stop signal and joins the thread. Idempotent.
  void Stop() {
    stop_.request_stop();
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
      thread_.join();
      RESYNC_LOG_INFO(kComponent, "resource sync thread stopped");
    }
  }

  void Join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  bool StopRequested() const { return stop_.stop_requested(); }

  // Valid once IsRunning() is false or Join() returned.
  const SyncReport &Report() const { return report_; }

  // One complete pass over the resource list on the calling thread.
  SyncReport Run(std::stop_token stop) {
    SyncReport report;
    report.resources.reserve(paths_.size());
    for (const auto &p : paths_) {
      report.resources.push_back(ResourceResult{.path = p});
    }

    std::unique_ptr<IApplication> app = Launch(report);
    for (std::size_t i = 0; i < report.resources.size(); ++i) {
      auto &res = report.resources[i];
      if (stop.stop_requested()) {
        RESYNC_LOG_INFO(kComponent, "stop requested, "
                                        << report.resources.size() - i
                                        << " resources left unprocessed");
        report.stopped = true;
        break;
      }
      if (!exists_(res.path)) {
        RESYNC_LOG_WARN(kComponent, "resource does not exist: " << res.path);
        res.outcome = Outcome::skipped_missing;
        continue;
      }
      SyncResource(app, res, report);
    }
    Teardown(app, report);

    RESYNC_LOG_INFO(kComponent,
                    "sync finished: " << report.Count(Outcome::synced)
                                      << " synced, "
                                      << report.Count(Outcome::skipped_missing)
                                      << " missing, "
                                      << report.Count(Outcome::abandoned)
                                      << " abandoned");
    return report;
  }

private:
  void SyncResource(std::unique_ptr<IApplication> &app, ResourceResult &res,
                    SyncReport &report) {
    RESYNC_LOG_INFO(kComponent, "syncing " << res.path);
    retry::RetryState state{options_.max_retries, options_.retry_delay};
    while (state.CanAttempt()) {
      if (!app) {
        app = Launch(report);
      }
      Status st = app ? SyncOnce(*app, res.path)
                      : Status(std::unexpected(
                            std::string("application is not available")));
      if (st) {
        res.attempts = state.attempts + 1;
        res.outcome = Outcome::synced;
        RESYNC_LOG_INFO(kComponent, "synced " << res.path);
        return;
      }
      const retry::Decision decision = state.RecordFailure();
      res.attempts = state.attempts;
      RESYNC_LOG_ERROR(kComponent, res.path << ": attempt " << state.attempts
                                            << "/" << state.max_attempts
                                            << " failed: " << st.error());
      if (!decision.ShouldRetry()) {
        break;
      }
      RESYNC_LOG_INFO(kComponent, "retrying " << res.path << " in "
                                              << decision.delay.count()
                                              << " ms");
      retry::WaitSync(decision.delay);
    }

    res.outcome = Outcome::abandoned;
    RESYNC_LOG_ERROR(kComponent, res.path << ": failed " << state.max_attempts
                                          << " times, restarting application");
    Teardown(app, report);
    app = Launch(report);
  }

  Status SyncOnce(IApplication &app, const std::string &path) {
    std::unique_ptr<IResource> resource;
    if (auto st = Guarded("open", [&] { resource = app.Open(path); }); !st) {
      return st;
    }
    if (!resource) {
      return std::unexpected(std::string("open: driver returned no handle"));
    }
    RESYNC_LOG_DEBUG(kComponent, "opened " << path);

    auto st = Guarded("refresh", [&] { resource->Refresh(); });
    if (st) {
      RESYNC_LOG_DEBUG(kComponent, "refresh triggered for "
                                       << path << ", waiting "
                                       << options_.refresh_interval.count()
                                       << " ms");
      retry::WaitSync(options_.refresh_interval);
      st = Guarded("save", [&] { resource->Save(); });
    }
    if (!st) {
      // the application stays alive for the next attempt: release the handle
      if (auto closed = Guarded("close", [&] { resource->Close(); });
          !closed) {
        RESYNC_LOG_WARN(kComponent, path << ": " << closed.error());
      }
      return st;
    }
    RESYNC_LOG_DEBUG(kComponent, "saved " << path);

    if (auto closed = Guarded("close", [&] { resource->Close(); }); !closed) {
      return closed;
    }
    RESYNC_LOG_DEBUG(kComponent, "closed " << path);
    return {};
  }

  std::unique_ptr<IApplication> Launch(SyncReport &report) {
    std::unique_ptr<IApplication> app;
    if (auto st = Guarded("construct",
                          [&] { app = driver_.Construct(options_.hidden); });
        !st) {
      RESYNC_LOG_ERROR(kComponent, "application start failed: " << st.error());
      return nullptr;
    }
    if (app) {
      ++report.launches;
      RESYNC_LOG_INFO(kComponent, "application started");
    }
    return app;
  }

  // Best effort: a teardown failure is logged and the handle dropped anyway.
  void Teardown(std::unique_ptr<IApplication> &app, SyncReport &report) {
    if (!app) {
      return;
    }
    ++report.teardowns;
    if (auto st = Guarded("teardown", [&] { app->Teardown(); }); !st) {
      RESYNC_LOG_WARN(kComponent, "application " << st.error());
    } else {
      RESYNC_LOG_INFO(kComponent, "application torn down");
    }
    app.reset();
  }

  template <typename Fn> static Status Guarded(const char *stage, Fn &&fn) {
    try {
      fn();
      return {};
    } catch (const std::exception &e) {
      return std::unexpected(std::string(stage) + ": " + e.what());
    } catch (...) {
      return std::unexpected(std::string(stage) + ": unknown failure");
    }
  }

  std::vector<std::string> paths_;
  IApplicationDriver &driver_;
  SyncOptions options_;
  ExistsFn exists_;
  std::function<void()> on_finished_;

  std::stop_source stop_;
  std::atomic<bool> running_{false};
  std::mutex thread_mutex_;
  std::jthread thread_;
  SyncReport report_;
};

} // namespace resources
