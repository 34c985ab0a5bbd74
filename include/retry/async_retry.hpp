#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <exception>
#include <string>
#include <utility>

#include "logging/log.hpp"
#include "retry/errors.hpp"
#include "retry/policy.hpp"

namespace retry {

struct RetryOptions {
  std::string name;
  int max_attempts = 3;
  Millis delay{2000};
};

// WithRetry<Filter>(ioc, options, op)
// Wraps a coroutine operation `R op(yield_context, Args...)` into one with the
// same signature that:
// - returns the first successful result
// - on a failure matching Filter logs a warning, waits `delay` on the
//   io_context (the coroutine is suspended, the thread is not) and calls op
//   again with the same arguments
// - after max_attempts matching failures throws OperationExhausted wrapping
//   the last failure
// - rethrows any other failure unchanged without consuming an attempt
// op must be safe to repeat.
//
// The wait happens outside the catch block: stackful coroutines must not
// switch context while an exception is being handled.
template <typename Filter, typename Op>
auto WithRetry(net::io_context &ioc, RetryOptions options, Op op) {
  return [&ioc, options = std::move(options),
          op = std::move(op)](net::yield_context yield, auto &&...args) {
    const Policy policy{options.max_attempts, options.delay};
    for (int attempt = 1;; ++attempt) {
      std::exception_ptr failure;
      try {
        return op(yield, args...);
      } catch (...) {
        failure = std::current_exception();
      }
      if (!Filter::Matches(failure)) {
        std::rethrow_exception(failure);
      }
      RESYNC_LOG_WARN("retry", "Attempt " << attempt << " failed for "
                                          << options.name << ": "
                                          << Describe(failure));
      const Decision decision = policy.Decide(attempt, true);
      if (!decision.ShouldRetry()) {
        RESYNC_LOG_ERROR("retry", "All " << policy.max_attempts
                                         << " attempts failed for "
                                         << options.name);
        throw OperationExhausted(options.name, attempt, failure);
      }
      WaitAsync(ioc, yield, decision.delay);
    }
  };
}

} // namespace retry
