#pragma once

#include <cerrno>
#include <cstddef>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace pollrun::io {

// Writes the whole buffer, retrying on EINTR/EAGAIN. Returns false on any
// other error, with errno left as set by write(2).
inline bool WriteAll(int fd, const char *data, std::size_t len) {
  const char *p = data;
  std::size_t remaining = len;
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return false;
    }
    p += static_cast<std::size_t>(n);
    remaining -= static_cast<std::size_t>(n);
  }
  return true;
}

// writev(2) until every iovec is consumed. `iov` is modified in place.
inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
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
      return false;
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<std::size_t>(consumed);
        consumed = 0;
      }
    }
  }
  return true;
}

} // namespace pollrun::io
