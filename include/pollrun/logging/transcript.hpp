#pragma once

#include "pollrun/io/file_writer.hpp"
#include "pollrun/logging/log_event.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/uio.h>
#include <unistd.h>
#include <vector>

namespace pollrun::logging {

// Transcript — append-only file copy of the lines a controller renders.
// Not thread-safe: owned by the controller loop that drains the channels.
// Lines are prefixed with the short session tag so several sessions can
// share one file.
class Transcript {
public:
  static constexpr int kBatch = 64;

  explicit Transcript(const std::string &path) : path_(path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ == -1) {
      error_ = std::strerror(errno);
    }
  }

  ~Transcript() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  Transcript(const Transcript &) = delete;
  Transcript &operator=(const Transcript &) = delete;

  bool OpenOk() const { return fd_ != -1; }
  const std::string &Path() const { return path_; }
  const std::string &Error() const { return error_; }

  // Returns false (and records Error()) if the write failed.
  bool Append(const std::string &tag, const std::vector<LogEvent> &events) {
    if (fd_ == -1 || events.empty()) {
      return fd_ != -1;
    }
    std::vector<std::string> lines;
    lines.reserve(events.size());
    for (const auto &ev : events) {
      lines.push_back(tag + " " + FormatLine(ev) + "\n");
    }
    struct iovec iov[kBatch];
    int cnt = 0;
    for (auto &line : lines) {
      iov[cnt] = {line.data(), line.size()};
      if (++cnt == kBatch) {
        if (!io::WritevAll(fd_, iov, cnt)) {
          error_ = std::strerror(errno);
          return false;
        }
        cnt = 0;
      }
    }
    if (cnt > 0 && !io::WritevAll(fd_, iov, cnt)) {
      error_ = std::strerror(errno);
      return false;
    }
    return true;
  }

  bool AppendRaw(const std::string &text) {
    if (fd_ == -1) {
      return false;
    }
    if (!io::WriteAll(fd_, text.data(), text.size())) {
      error_ = std::strerror(errno);
      return false;
    }
    return true;
  }

private:
  std::string path_;
  std::string error_;
  int fd_ = -1;
};

} // namespace pollrun::logging
