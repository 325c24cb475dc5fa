#pragma once

#include "pollrun/core/clock.hpp"
#include "pollrun/core/config.hpp"
#include "pollrun/core/poll_service.hpp"
#include "pollrun/logging/log_event.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace pollrun::testing {

using namespace std::chrono_literals;

// ManualClock — virtual time. WaitFor advances the clock by the requested
// amount without sleeping; `on_wait` runs after each advance so a test can
// request a stop at a chosen virtual instant.
class ManualClock : public Clock {
public:
  time_point Now() override {
    std::lock_guard<std::mutex> lk(mx_);
    return now_;
  }

  bool WaitFor(duration d, std::stop_token st) override {
    if (st.stop_requested()) {
      return false;
    }
    time_point reached;
    {
      std::lock_guard<std::mutex> lk(mx_);
      now_ += std::max(d, duration::zero());
      reached = now_;
      waits_.push_back(d);
    }
    if (on_wait) {
      on_wait(reached);
    }
    return !st.stop_requested();
  }

  std::chrono::milliseconds Elapsed() {
    std::lock_guard<std::mutex> lk(mx_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(now_ -
                                                                 origin_);
  }

  std::vector<duration> Waits() {
    std::lock_guard<std::mutex> lk(mx_);
    return waits_;
  }

  std::function<void(time_point)> on_wait;

private:
  std::mutex mx_;
  time_point origin_{std::chrono::hours(1)};
  time_point now_{origin_};
  std::vector<duration> waits_;
};

// ScriptedPollService — answers from queued results. An empty detection
// script means "no poll open"; an empty answer script returns `response`.
class ScriptedPollService : public IPollService {
public:
  PollStatus Login(const Credentials &credentials) override {
    logins.fetch_add(1);
    last_identity = credentials.identity;
    Delay(login_delay);
    if (login_error) {
      return std::unexpected(*login_error);
    }
    return {};
  }

  PollResult<std::string> FetchWatchToken() override {
    if (token_error) {
      return std::unexpected(*token_error);
    }
    return std::string("watch-token");
  }

  PollResult<std::optional<std::string>>
  DetectNewPoll(const std::string &watch_token) override {
    detect_calls.fetch_add(1);
    seen_token = watch_token;
    Delay(detect_delay);
    if (throw_on_detect) {
      throw std::runtime_error("connection reset by peer");
    }
    std::lock_guard<std::mutex> lk(mx_);
    if (detections.empty()) {
      return std::optional<std::string>{};
    }
    auto next = detections.front();
    detections.pop_front();
    return next;
  }

  PollResult<std::string> SubmitAnswer(const std::string &poll_id) override {
    answer_calls.fetch_add(1);
    std::lock_guard<std::mutex> lk(mx_);
    answered.push_back(poll_id);
    if (answers.empty()) {
      return response;
    }
    auto next = answers.front();
    answers.pop_front();
    return next;
  }

  void QueuePoll(const std::string &id) {
    std::lock_guard<std::mutex> lk(mx_);
    detections.push_back(std::optional<std::string>(id));
  }

  void QueueDetectError(PollErrorKind kind, const std::string &msg) {
    std::lock_guard<std::mutex> lk(mx_);
    detections.push_back(std::unexpected(PollError{kind, msg}));
  }

  void QueueAnswerError(PollErrorKind kind, const std::string &msg) {
    std::lock_guard<std::mutex> lk(mx_);
    answers.push_back(std::unexpected(PollError{kind, msg}));
  }

  std::optional<PollError> login_error;
  std::optional<PollError> token_error;
  std::chrono::milliseconds login_delay{0};
  std::chrono::milliseconds detect_delay{0};
  bool throw_on_detect = false;
  std::string response = "option B";

  std::atomic<int> logins{0};
  std::atomic<int> detect_calls{0};
  std::atomic<int> answer_calls{0};
  std::string last_identity;
  std::string seen_token;
  std::vector<std::string> answered;

private:
  static void Delay(std::chrono::milliseconds d) {
    if (d.count() > 0) {
      std::this_thread::sleep_for(d);
    }
  }

  std::mutex mx_;
  std::deque<PollResult<std::optional<std::string>>> detections;
  std::deque<PollResult<std::string>> answers;
};

inline SessionConfig MakeConfig(std::chrono::seconds lifetime = 60s,
                                std::chrono::seconds closed_wait = 5s,
                                std::chrono::seconds open_wait = 2s) {
  SessionConfig cfg;
  cfg.credentials.identity = "student@example.edu";
  cfg.credentials.secret = "hunter2";
  cfg.credentials.host = "cs3410";
  cfg.credentials.login_mode = LoginMode::standard;
  cfg.lifetime = lifetime;
  cfg.closed_wait = closed_wait;
  cfg.open_wait = open_wait;
  cfg.retry.max_attempts = 3;
  cfg.retry.initial_backoff = 1000ms;
  cfg.retry.max_backoff = 4000ms;
  return cfg;
}

inline std::vector<logging::LogEvent>
OfLevel(const std::vector<logging::LogEvent> &events, logging::LogLevel lvl) {
  std::vector<logging::LogEvent> out;
  std::copy_if(events.begin(), events.end(), std::back_inserter(out),
               [lvl](const logging::LogEvent &e) { return e.level == lvl; });
  return out;
}

inline bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
inline bool Eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

} // namespace pollrun::testing
