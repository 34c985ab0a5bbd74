#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>

namespace core {

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the io_context that acts as the cooperative scheduler
// - Runs io_context::run() on exactly one std::jthread: coroutines spawned on
//   it never run in parallel, so state they share needs no locking
// - A work guard keeps run() alive while no handler is pending
class Reactor {
public:
  Reactor() = default;

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }

  void Start() {
    if (thread_.joinable()) {
      return;
    }
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    thread_ = std::jthread([this] { ioc_.run(); });
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  void Join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ~Reactor() {
    Stop();
    Join();
  }

private:
  net::io_context ioc_;
  std::jthread thread_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};

} // namespace core
