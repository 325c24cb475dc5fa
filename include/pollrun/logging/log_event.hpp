#pragma once

#include "pollrun/util/time.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace pollrun::logging {

enum class LogLevel { debug, info, success, poll, error };

inline std::string_view LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::debug:
    return "DEBUG";
  case LogLevel::info:
    return "INFO";
  case LogLevel::success:
    return "SUCCESS";
  case LogLevel::poll:
    return "POLL";
  case LogLevel::error:
    return "ERROR";
  }
  return "INFO";
}

// LogEvent — one entry of a session's event stream. `offset` is measured on
// the runner's own clock from the moment the runner started, so it stays
// meaningful under a virtual clock; `wall` is only used for display.
struct LogEvent {
  std::chrono::system_clock::time_point wall;
  std::chrono::milliseconds offset{0};
  LogLevel level = LogLevel::info;
  std::string message;
};

// "[2024-03-01 09:15:02] [POLL] detected poll-42"
inline std::string FormatLine(const LogEvent &ev) {
  std::string line;
  line.reserve(ev.message.size() + 32);
  line += '[';
  line += timeutil::FormatLocal(ev.wall);
  line += "] [";
  line += LevelName(ev.level);
  line += "] ";
  line += ev.message;
  return line;
}

} // namespace pollrun::logging
