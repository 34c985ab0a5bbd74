#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace retry {

// Renders an exception_ptr for log lines.
inline std::string Describe(const std::exception_ptr &e) {
  if (!e) {
    return "no exception";
  }
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

// OperationExhausted: every configured attempt of one logical operation
// failed. Cause() is the failure of the last attempt.
class OperationExhausted : public std::runtime_error {
public:
  OperationExhausted(std::string operation, int attempts,
                     std::exception_ptr cause)
      : std::runtime_error("operation '" + operation + "' failed after " +
                           std::to_string(attempts) +
                           " attempts: " + Describe(cause)),
        operation_(std::move(operation)), attempts_(attempts),
        cause_(std::move(cause)) {}

  const std::string &Operation() const { return operation_; }
  int Attempts() const { return attempts_; }
  const std::exception_ptr &Cause() const { return cause_; }

  [[noreturn]] void RethrowCause() const { std::rethrow_exception(cause_); }

private:
  std::string operation_;
  int attempts_;
  std::exception_ptr cause_;
};

// RetryOn<E...>: exception kinds treated as retryable, matched by dynamic type
// so that derived exceptions match their base. Non-std exceptions never match.
template <typename... Retryable> struct RetryOn {
  static bool Matches(const std::exception_ptr &e) {
    if (!e) {
      return false;
    }
    try {
      std::rethrow_exception(e);
    } catch (const std::exception &ex) {
      return (... || (dynamic_cast<const Retryable *>(&ex) != nullptr));
    } catch (...) {
      return false;
    }
  }
};

template <> struct RetryOn<> {
  static bool Matches(const std::exception_ptr &) { return false; }
};

using RetryOnAny = RetryOn<std::exception>;

} // namespace retry
