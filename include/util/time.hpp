#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

inline std::string FormatLocal(std::chrono::system_clock::time_point tp,
                               const char *fmt) {
  return FormatTm(LocalTime(std::chrono::system_clock::to_time_t(tp)), fmt);
}

// HH:MM:SS.mmm for log lines
inline std::string ClockTime() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
  std::ostringstream oss;
  oss << FormatLocal(now, "%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Date as typed into the portal's period inputs: YYYY/MM/DD
inline std::string PortalDate(std::chrono::system_clock::time_point tp) {
  return FormatLocal(tp, "%Y/%m/%d");
}

inline std::string Today() {
  return PortalDate(std::chrono::system_clock::now());
}

} // namespace timeutil
