#pragma once

#include "pollrun/logging/log_event.hpp"
#include "pollrun/util/branch.hpp"
#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pollrun::logging {

// LogChannel — event stream from one session runner to its observers.
// Threading model:
// - Exactly one producer (the runner thread) calls Push
// - Any number of consumers call Drain, from any thread; each event is handed
//   to exactly one Drain call, and events from the single producer come out
//   in emission order
// - Backed by a node-based boost::lockfree::queue, so Push never blocks
//
// With the default capacity of 0 the channel is unbounded: if nobody drains,
// memory grows for as long as the runner keeps emitting. Pass a capacity to
// bound it; events pushed while full are dropped and counted, and the next
// Drain reports the loss as a trailing error event. PushTerminal bypasses the
// bound so a session's closing event is never lost.
class LogChannel {
public:
  static constexpr std::size_t kInitialNodes = 64;

  explicit LogChannel(std::size_t capacity = 0)
      : capacity_(capacity), queue_(kInitialNodes) {}

  ~LogChannel() {
    queue_.consume_all(
        [](LogEvent *ev) { std::unique_ptr<LogEvent> owned(ev); });
  }

  LogChannel(const LogChannel &) = delete;
  LogChannel &operator=(const LogChannel &) = delete;

  // Returns false only when the event was dropped (bounded channel full or
  // allocation failure).
  bool Push(LogEvent ev) {
    if (capacity_ != 0 &&
        POLLRUN_UNLIKELY(size_.fetch_add(1, std::memory_order_acq_rel) >=
                         capacity_)) {
      size_.fetch_sub(1, std::memory_order_acq_rel);
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    if (capacity_ == 0) {
      size_.fetch_add(1, std::memory_order_acq_rel);
    }
    return Enqueue(std::move(ev));
  }

  // Like Push but ignores the capacity. Used for the runner's last event.
  bool PushTerminal(LogEvent ev) {
    size_.fetch_add(1, std::memory_order_acq_rel);
    return Enqueue(std::move(ev));
  }

  // Removes and returns everything buffered so far, oldest first.
  std::vector<LogEvent> Drain() {
    std::vector<LogEvent> out;
    out.reserve(size_.load(std::memory_order_acquire));
    LogEvent *raw = nullptr;
    while (queue_.pop(raw)) {
      std::unique_ptr<LogEvent> ev(raw);
      size_.fetch_sub(1, std::memory_order_acq_rel);
      out.push_back(std::move(*ev));
    }
    const std::size_t lost = dropped_.exchange(0, std::memory_order_relaxed);
    if (lost > 0) {
      LogEvent summary;
      summary.wall = std::chrono::system_clock::now();
      summary.offset = out.empty() ? std::chrono::milliseconds{0}
                                   : out.back().offset;
      summary.level = LogLevel::error;
      summary.message = "log channel full: " + std::to_string(lost) +
                        " event(s) dropped";
      out.push_back(std::move(summary));
    }
    return out;
  }

  // Approximate number of buffered events.
  std::size_t Pending() const { return size_.load(std::memory_order_acquire); }

  // Events dropped since the last Drain.
  std::size_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  // size_ is already counted for `ev`.
  bool Enqueue(LogEvent ev) {
    auto node = std::make_unique<LogEvent>(std::move(ev));
    if (POLLRUN_UNLIKELY(!queue_.push(node.get()))) {
      size_.fetch_sub(1, std::memory_order_acq_rel);
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    node.release();
    return true;
  }

  const std::size_t capacity_;
  boost::lockfree::queue<LogEvent *> queue_;
  std::atomic<std::size_t> size_{0};
  std::atomic<std::size_t> dropped_{0};
};

} // namespace pollrun::logging
