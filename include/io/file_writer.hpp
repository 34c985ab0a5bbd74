#pragma once

#include <cerrno>
#include <expected>
#include <sys/uio.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace io {

using WriteStatus = std::expected<void, std::error_code>;

// Writes every iovec in full, advancing past partial writes. iov is modified.
inline WriteStatus WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<size_t>(consumed);
        consumed = 0;
      }
    }
    // skip zero-length entries so a fully consumed batch terminates
    while (cnt > 0 && iov[0].iov_len == 0) {
      ++iov;
      --cnt;
    }
  }
  return {};
}

} // namespace io
