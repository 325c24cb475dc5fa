#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace pollrun::timeutil {

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

// Formats a wall-clock point in local time, e.g. "2024-03-01 09:15:02".
inline std::string FormatLocal(std::chrono::system_clock::time_point tp,
                               const char *fmt = "%Y-%m-%d %H:%M:%S") {
  std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  return FormatTm(LocalTime(tt), fmt);
}

// Renders a duration as a compact human string: "45s", "3m05s", "1h20m00s".
template <typename Rep, typename Period>
inline std::string FormatDuration(std::chrono::duration<Rep, Period> d) {
  auto total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
  if (total < 0) {
    total = 0;
  }
  const auto h = total / 3600;
  const auto m = (total % 3600) / 60;
  const auto s = total % 60;
  std::ostringstream oss;
  if (h > 0) {
    oss << h << 'h' << std::setw(2) << std::setfill('0') << m << 'm'
        << std::setw(2) << s << 's';
  } else if (m > 0) {
    oss << m << 'm' << std::setw(2) << std::setfill('0') << s << 's';
  } else {
    oss << s << 's';
  }
  return oss.str();
}

} // namespace pollrun::timeutil
