#pragma once

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <thread>

// namespace retry: bounded-attempt retry decisions plus the sync/async waits
// used between attempts. The delay is fixed per attempt; there is no
// exponential growth.
namespace retry {

namespace net = boost::asio;
using Millis = std::chrono::milliseconds;

struct Decision {
  enum class Kind { retry, fail };

  Kind kind = Kind::fail;
  Millis delay{0};

  bool ShouldRetry() const { return kind == Kind::retry; }

  static Decision Retry(Millis delay) { return {Kind::retry, delay}; }
  static Decision Fail() { return {Kind::fail, Millis{0}}; }
};

// attempt is the number of attempts made so far, counting the one that just
// failed.
inline Decision Decide(int attempt, int maxAttempts, bool failureIsRetryable,
                       Millis baseDelay) {
  if (!failureIsRetryable || attempt >= maxAttempts) {
    return Decision::Fail();
  }
  return Decision::Retry(baseDelay);
}

struct Policy {
  int max_attempts = 3;
  Millis base_delay{2000};

  Policy() = default;
  Policy(int maxAttempts, Millis baseDelay)
      : max_attempts(std::max(1, maxAttempts)), base_delay(baseDelay) {}

  Decision Decide(int attempt, bool failureIsRetryable) const {
    return retry::Decide(attempt, max_attempts, failureIsRetryable,
                         base_delay);
  }
};

// RetryState: per-operation counter; attempts never exceeds max_attempts.
struct RetryState {
  int attempts = 0;
  int max_attempts = 1;
  Millis base_delay{0};

  RetryState(int maxAttempts, Millis baseDelay)
      : max_attempts(std::max(1, maxAttempts)), base_delay(baseDelay) {}

  bool CanAttempt() const { return attempts < max_attempts; }
  bool Exhausted() const { return attempts >= max_attempts; }

  // Records one failed attempt and returns what to do next.
  Decision RecordFailure(bool failureIsRetryable = true) {
    if (attempts < max_attempts) {
      ++attempts;
    }
    return Decide(attempts, max_attempts, failureIsRetryable, base_delay);
  }
};

inline void WaitSync(Millis delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

// Suspends the calling coroutine without blocking the io_context thread.
inline void WaitAsync(net::io_context &ioc, net::yield_context yield,
                      Millis delay) {
  boost::system::error_code ec;
  net::steady_timer t(ioc);
  t.expires_after(delay);
  t.async_wait(yield[ec]);
  (void)ec;
}

} // namespace retry
