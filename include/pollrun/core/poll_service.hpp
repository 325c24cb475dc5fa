#pragma once

#include "pollrun/core/config.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace pollrun {

enum class PollErrorKind { authentication, transient, permanent };

inline std::string_view KindName(PollErrorKind kind) {
  switch (kind) {
  case PollErrorKind::authentication:
    return "authentication";
  case PollErrorKind::transient:
    return "transient";
  case PollErrorKind::permanent:
    return "permanent";
  }
  return "permanent";
}

struct PollError {
  PollErrorKind kind = PollErrorKind::permanent;
  std::string message;
};

template <typename T> using PollResult = std::expected<T, PollError>;
using PollStatus = std::expected<void, PollError>;

inline std::unexpected<PollError> MakeError(PollErrorKind kind,
                                            std::string message) {
  return std::unexpected(PollError{kind, std::move(message)});
}

// IPollService — the polling service as seen by a session runner. One
// instance belongs to exactly one runner and is only called from that
// runner's thread; implementations may block on network I/O and report
// failures as values rather than by throwing.
class IPollService {
public:
  virtual ~IPollService() = default;

  virtual PollStatus Login(const Credentials &credentials) = 0;

  // Token authorising the poll-detection calls that follow a login.
  virtual PollResult<std::string> FetchWatchToken() = 0;

  // Id of a poll opened since the last call, or nullopt when none is open.
  virtual PollResult<std::optional<std::string>>
  DetectNewPoll(const std::string &watch_token) = 0;

  // Submits a response and returns a description of what was sent.
  virtual PollResult<std::string> SubmitAnswer(const std::string &poll_id) = 0;
};

} // namespace pollrun
