#pragma once

#include "pollrun/core/config.hpp"
#include <algorithm>
#include <chrono>

// namespace retry — exponential backoff for transient poll-service failures.
// Only computes delays; the runner waits them out on its Clock.
namespace pollrun::retry {

struct Backoff {
  std::chrono::milliseconds initial{1000};
  std::chrono::milliseconds current{1000};
  std::chrono::milliseconds max{30000};
  int max_attempts = 5;
  int failures = 0;

  Backoff() = default;
  explicit Backoff(const RetryPolicy &policy)
      : initial(policy.initial_backoff), current(policy.initial_backoff),
        max(policy.max_backoff), max_attempts(policy.max_attempts) {}

  void Reset() {
    current = initial;
    failures = 0;
  }

  // Records a failure. Returns false once the attempt budget is used up.
  bool RecordFailure() {
    ++failures;
    return failures < max_attempts;
  }

  std::chrono::milliseconds Next() {
    auto v = current;
    current = std::min(max, current * 2);
    return v;
  }
};

} // namespace pollrun::retry
