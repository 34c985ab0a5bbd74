#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "util/time.hpp"

// namespace logging: process-wide log router shared by the reactor thread,
// the resource sync thread and the bridge pool threads.
// - Records below the threshold are dropped before formatting
// - Console sink writes to stderr; the file sink receives the same
//   pre-formatted line (see FileLogger); an optional record sink observes
//   structured records
// - Sinks are invoked under one mutex so lines never interleave
namespace logging {

enum class Level : std::uint8_t { debug = 0, info = 1, warning = 2, error = 3 };

inline const char *LevelName(Level level) {
  switch (level) {
  case Level::debug:
    return "DEBUG";
  case Level::info:
    return "INFO ";
  case Level::warning:
    return "WARN ";
  case Level::error:
    return "ERROR";
  }
  return "?????";
}

inline std::optional<Level> ParseLevel(std::string_view s) {
  if (s == "debug")
    return Level::debug;
  if (s == "info")
    return Level::info;
  if (s == "warning" || s == "warn")
    return Level::warning;
  if (s == "error")
    return Level::error;
  return std::nullopt;
}

struct Record {
  Level level;
  std::string component;
  std::string message;
};

using RecordSink = std::function<void(const Record &)>;
using LineSink = std::function<void(std::string_view)>;

namespace detail {

struct Router {
  std::mutex mutex;
  std::atomic<Level> threshold{Level::debug};
  bool console = true;
  LineSink file;
  RecordSink records;
};

inline Router &GetRouter() {
  static Router router;
  return router;
}

} // namespace detail

inline void SetThreshold(Level level) {
  detail::GetRouter().threshold.store(level, std::memory_order_relaxed);
}

inline bool Enabled(Level level) {
  return level >= detail::GetRouter().threshold.load(std::memory_order_relaxed);
}

inline void EnableConsole(bool enabled) {
  auto &r = detail::GetRouter();
  std::lock_guard<std::mutex> lock(r.mutex);
  r.console = enabled;
}

// Installs the file sink and returns the previous one.
inline LineSink SetFileSink(LineSink sink) {
  auto &r = detail::GetRouter();
  std::lock_guard<std::mutex> lock(r.mutex);
  return std::exchange(r.file, std::move(sink));
}

// Installs the record sink and returns the previous one.
inline RecordSink SetRecordSink(RecordSink sink) {
  auto &r = detail::GetRouter();
  std::lock_guard<std::mutex> lock(r.mutex);
  return std::exchange(r.records, std::move(sink));
}

inline std::string FormatLine(Level level, std::string_view component,
                              std::string_view message) {
  std::string line = timeutil::ClockTime();
  line += ' ';
  line += LevelName(level);
  line += " [";
  line += component;
  line += "] ";
  line += message;
  line += '\n';
  return line;
}

inline void Write(Level level, std::string_view component,
                  std::string message) {
  if (!Enabled(level)) {
    return;
  }
  const std::string line = FormatLine(level, component, message);
  auto &r = detail::GetRouter();
  std::lock_guard<std::mutex> lock(r.mutex);
  if (r.console) {
    std::cerr << line;
  }
  if (r.file) {
    r.file(line);
  }
  if (r.records) {
    r.records(Record{level, std::string(component), std::move(message)});
  }
}

} // namespace logging

// Stream-style logging: RESYNC_LOG_INFO("resource_sync", "opened " << path);
#define RESYNC_LOG(level, component, expr)                                     \
  do {                                                                         \
    if (::logging::Enabled(level)) {                                           \
      std::ostringstream resync_log_stream_;                                   \
      resync_log_stream_ << expr;                                              \
      ::logging::Write(level, component, resync_log_stream_.str());            \
    }                                                                          \
  } while (0)

#define RESYNC_LOG_DEBUG(component, expr)                                      \
  RESYNC_LOG(::logging::Level::debug, component, expr)
#define RESYNC_LOG_INFO(component, expr)                                       \
  RESYNC_LOG(::logging::Level::info, component, expr)
#define RESYNC_LOG_WARN(component, expr)                                       \
  RESYNC_LOG(::logging::Level::warning, component, expr)
#define RESYNC_LOG_ERROR(component, expr)                                      \
  RESYNC_LOG(::logging::Level::error, component, expr)
