#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace pollrun {

// Clock — time source and wait primitive for the session runner. Every delay
// the runner takes goes through WaitFor, so tests can substitute a virtual
// clock that advances instantly.
class Clock {
public:
  using duration = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;

  virtual time_point Now() = 0;

  // Waits for `d` or until `st` is stopped. Returns true if the full duration
  // elapsed, false if the wait was cut short by a stop request.
  virtual bool WaitFor(duration d, std::stop_token st) = 0;
};

// SteadyClock — real time. Waits park on a condition variable bound to the
// stop token, so a stop request wakes them immediately.
class SteadyClock : public Clock {
public:
  time_point Now() override { return std::chrono::steady_clock::now(); }

  bool WaitFor(duration d, std::stop_token st) override {
    if (d <= duration::zero()) {
      return !st.stop_requested();
    }
    std::mutex mx;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mx);
    (void)cv.wait_for(lk, st, d, [] { return false; });
    return !st.stop_requested();
  }
};

} // namespace pollrun
