#pragma once

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace bridge {

namespace net = boost::asio;

class BlockingCallTimeout : public std::runtime_error {
public:
  explicit BlockingCallTimeout(std::chrono::milliseconds timeout)
      : std::runtime_error("blocking call did not finish within " +
                           std::to_string(timeout.count()) + " ms") {}
};

// BlockingBridge
// Threading model:
// - Owns a fixed-size asio::thread_pool; at most PoolSize() submitted calls
//   run at once, the rest queue in submission order but complete in any order
// - Run() is called from a coroutine on a single-threaded io_context: the
//   call is posted to the pool and the coroutine suspends on a timer; the
//   pool thread posts the wake-up back to the io_context, so the coroutine
//   always resumes on its own thread
// - No built-in timeout and no cancellation: a call that never returns keeps
//   its pool slot forever. RunFor() stops waiting but cannot stop the call.
class BlockingBridge {
public:
  static constexpr std::size_t kDefaultPoolSize = 5;

  explicit BlockingBridge(net::io_context &ioc,
                          std::size_t poolSize = kDefaultPoolSize)
      : ioc_(ioc), pool_size_(std::max<std::size_t>(1, poolSize)),
        pool_(pool_size_) {}

  ~BlockingBridge() { pool_.join(); }

  BlockingBridge(const BlockingBridge &) = delete;
  BlockingBridge &operator=(const BlockingBridge &) = delete;

  std::size_t PoolSize() const { return pool_size_; }

  template <typename Fn>
  auto Run(Fn &&fn, net::yield_context yield) -> std::invoke_result_t<Fn &> {
    return Await(std::forward<Fn>(fn), std::nullopt, yield);
  }

  template <typename Fn>
  auto RunFor(Fn &&fn, std::chrono::milliseconds timeout,
              net::yield_context yield) -> std::invoke_result_t<Fn &> {
    return Await(std::forward<Fn>(fn), timeout, yield);
  }

private:
  template <typename R> struct Completion {
    using Stored = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

    explicit Completion(net::io_context &ioc) : timer(ioc) {}

    net::steady_timer timer;
    std::optional<Stored> value;
    std::exception_ptr error;
    bool done = false; // touched only on the io_context thread
  };

  template <typename Fn>
  auto Await(Fn &&fn, std::optional<std::chrono::milliseconds> timeout,
             net::yield_context yield) -> std::invoke_result_t<Fn &> {
    using R = std::invoke_result_t<Fn &>;
    auto c = std::make_shared<Completion<R>>(ioc_);
    if (timeout.has_value()) {
      c->timer.expires_after(*timeout);
    } else {
      c->timer.expires_at(net::steady_timer::time_point::max());
    }

    net::post(pool_, [c, fn = std::forward<Fn>(fn)]() mutable {
      try {
        if constexpr (std::is_void_v<R>) {
          fn();
          c->value.emplace();
        } else {
          c->value.emplace(fn());
        }
      } catch (...) {
        c->error = std::current_exception();
      }
      net::post(c->timer.get_executor(), [c] {
        c->done = true;
        c->timer.cancel();
      });
    });

    for (;;) {
      boost::system::error_code ec;
      if (c->done) {
        break;
      }
      c->timer.async_wait(yield[ec]);
      if (c->done) {
        break;
      }
      if (!ec && timeout.has_value()) {
        throw BlockingCallTimeout(*timeout);
      }
    }

    if (c->error) {
      std::rethrow_exception(c->error);
    }
    if constexpr (!std::is_void_v<R>) {
      return std::move(*c->value);
    }
  }

  net::io_context &ioc_;
  std::size_t pool_size_;
  net::thread_pool pool_;
};

} // namespace bridge
