#pragma once

#include <algorithm>
#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

#include "io/file_writer.hpp"
#include "util/branch.hpp"

namespace logging {

// LogLine: pre-formatted line ready for writev; trivially copyable so it can
// travel through the lock-free queue without allocation
inline constexpr std::size_t kLogLineCapacity = 480;

struct LogLine {
  std::uint16_t len;
  char buf[kLogLineCapacity];
};

inline constexpr std::size_t kLogQueueCapacity = 1024;

using LogQueue =
    boost::lockfree::queue<LogLine,
                           boost::lockfree::capacity<kLogQueueCapacity>>;

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// FileLogger
// Threading model:
// - Any thread may Push (multi-producer lock-free queue); a full queue drops
//   the line instead of blocking the producer
// - Single background thread drains the queue and writes batched lines via
//   writev
// - Join() drains everything pushed before it was called
class FileLogger : public LoggerBase<FileLogger> {
public:
  explicit FileLogger(const std::string &path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  }

  ~FileLogger() {
    Join();
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  bool OpenOk() const { return fd_ != -1; }

  // Lines longer than a slot are truncated, keeping the trailing newline.
  bool Push(std::string_view line) {
    LogLine l;
    const std::size_t n = std::min(line.size(), kLogLineCapacity);
    std::memcpy(l.buf, line.data(), n);
    l.len = static_cast<std::uint16_t>(n);
    if (n == kLogLineCapacity && line.size() > n) {
      l.buf[n - 1] = '\n';
    }
    if (!queue_.bounded_push(l)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    return true;
  }

  std::size_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    for (;;) {
      const bool running = running_.load(std::memory_order_acquire);
      const std::size_t written = DrainQueue();
      if (RESYNC_UNLIKELY(!running)) {
        DrainQueue();
        break;
      }
      if (written == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
    }
  }

private:
  std::size_t DrainQueue() {
    LogLine batch[64];
    struct iovec iov[64];
    int cnt = 0;
    std::size_t total = 0;
    while (queue_.pop(batch[cnt])) {
      iov[cnt] = {static_cast<void *>(batch[cnt].buf), batch[cnt].len};
      ++cnt;
      if (cnt == 64) {
        Flush(iov, cnt);
        total += static_cast<std::size_t>(cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
      total += static_cast<std::size_t>(cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (RESYNC_UNLIKELY(fd_ == -1)) {
      return;
    }
    auto st = io::WritevAll(fd_, iov, cnt);
    if (!st && !write_failed_) {
      write_failed_ = true;
      std::cerr << "[file_logger] write failed: " << st.error().message()
                << "\n";
    }
  }

  LogQueue queue_;
  int fd_ = -1;
  bool write_failed_ = false;
  std::atomic<std::size_t> dropped_{0};
};

} // namespace logging
