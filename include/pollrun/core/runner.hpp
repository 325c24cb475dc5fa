#pragma once

#include "pollrun/core/clock.hpp"
#include "pollrun/core/config.hpp"
#include "pollrun/core/poll_service.hpp"
#include "pollrun/logging/log_channel.hpp"
#include "pollrun/logging/log_event.hpp"
#include "pollrun/net/backoff.hpp"
#include "pollrun/util/branch.hpp"
#include "pollrun/util/time.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace pollrun {

enum class RunnerState {
  idle,
  authenticating,
  watching,
  answering,
  stopped,
  failed
};

inline std::string_view StateName(RunnerState s) {
  switch (s) {
  case RunnerState::idle:
    return "idle";
  case RunnerState::authenticating:
    return "authenticating";
  case RunnerState::watching:
    return "watching";
  case RunnerState::answering:
    return "answering";
  case RunnerState::stopped:
    return "stopped";
  case RunnerState::failed:
    return "failed";
  }
  return "idle";
}

inline bool IsTerminal(RunnerState s) {
  return s == RunnerState::stopped || s == RunnerState::failed;
}

enum class ExitReason { none, stop_requested, lifetime_elapsed, failed };

inline std::string_view ReasonName(ExitReason r) {
  switch (r) {
  case ExitReason::none:
    return "running";
  case ExitReason::stop_requested:
    return "stop requested";
  case ExitReason::lifetime_elapsed:
    return "lifetime elapsed";
  case ExitReason::failed:
    return "failed";
  }
  return "running";
}

struct RunnerStats {
  std::uint64_t checks = 0;
  std::uint64_t polls_detected = 0;
  std::uint64_t answers = 0;
  std::uint64_t retries = 0;
};

// SessionRunner
// Threading model:
// - Run() executes the whole login -> watch -> answer loop on the calling
//   thread; Start() in session.hpp gives it a dedicated std::jthread
// - The runner is the single producer of its LogChannel
// - State(), Reason(), Stats() and Alive() may be read from any thread
// - Cancellation is the stop_token passed to Run(). It is checked at every
//   loop boundary and wakes the closed_wait, open_wait and backoff waits.
//   Calls into the poll service are never interrupted, so a stop issued
//   during one takes effect when it returns.
// - Nothing thrown inside the loop leaves Run(): every failure becomes the
//   `failed` state plus an error event
class SessionRunner {
public:
  SessionRunner(SessionConfig config, std::unique_ptr<IPollService> service,
                std::shared_ptr<Clock> clock,
                std::shared_ptr<logging::LogChannel> channel)
      : config_(std::move(config)), service_(std::move(service)),
        clock_(std::move(clock)), channel_(std::move(channel)) {}

  SessionRunner(const SessionRunner &) = delete;
  SessionRunner &operator=(const SessionRunner &) = delete;

  // Runs to completion. Only the first call does anything.
  void Run(std::stop_token st) {
    if (started_.exchange(true)) {
      return;
    }
    start_ = clock_->Now();
    deadline_ = start_ + config_.lifetime;

    ExitReason reason = ExitReason::failed;
    try {
      reason = Execute(st);
    } catch (const std::exception &e) {
      Emit(logging::LogLevel::error, std::string("session aborted: ") + e.what());
    } catch (...) {
      Emit(logging::LogLevel::error, "session aborted: unknown exception");
    }

    reason_.store(reason);
    state_.store(reason == ExitReason::failed ? RunnerState::failed
                                              : RunnerState::stopped);
    Emit(logging::LogLevel::info,
         "stopped (" + std::string(ReasonName(reason)) + ")", true);
    {
      std::lock_guard<std::mutex> lk(exit_mx_);
      exited_ = true;
    }
    exit_cv_.notify_all();
  }

  // Blocks up to `d` for Run() to return. True if it has.
  template <typename Rep, typename Period>
  bool WaitForExit(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lk(exit_mx_);
    return exit_cv_.wait_for(lk, d, [this] { return exited_; });
  }

  bool Alive() const {
    std::lock_guard<std::mutex> lk(exit_mx_);
    return !exited_;
  }

  RunnerState State() const { return state_.load(); }
  ExitReason Reason() const { return reason_.load(); }

  RunnerStats Stats() const {
    return RunnerStats{checks_.load(), polls_.load(), answers_.load(),
                       retries_.load()};
  }

  const SessionConfig &Config() const { return config_; }
  const std::shared_ptr<logging::LogChannel> &Channel() const {
    return channel_;
  }

private:
  enum class PauseResult { elapsed, stopped, deadline };

  ExitReason Execute(std::stop_token st) {
    const auto &host = config_.credentials.host;
    Emit(logging::LogLevel::info, "initialising session for host " + host);

    state_.store(RunnerState::authenticating);
    if (auto login = service_->Login(config_.credentials); !login) {
      Emit(logging::LogLevel::error, "login failed: " + login.error().message);
      return ExitReason::failed;
    }
    auto watch_token = service_->FetchWatchToken();
    if (!watch_token) {
      Emit(logging::LogLevel::error,
           "could not obtain watch token: " + watch_token.error().message);
      return ExitReason::failed;
    }
    Emit(logging::LogLevel::success,
         "login successful, watching " + host + " for polls");

    state_.store(RunnerState::watching);
    retry::Backoff backoff(config_.retry);
    for (;;) {
      if (st.stop_requested()) {
        return ExitReason::stop_requested;
      }
      if (clock_->Now() >= deadline_) {
        return ExitReason::lifetime_elapsed;
      }

      auto detected = service_->DetectNewPoll(*watch_token);
      checks_.fetch_add(1, std::memory_order_relaxed);
      if (POLLRUN_UNLIKELY(!detected)) {
        if (auto end = Recover("poll check", detected.error(), backoff, st)) {
          return *end;
        }
        continue;
      }
      backoff.Reset();

      if (!detected->has_value()) {
        if (Pause(config_.closed_wait, st) == PauseResult::elapsed) {
          Emit(logging::LogLevel::debug,
               "no new poll in the last " +
                   timeutil::FormatDuration(config_.closed_wait));
        }
        continue;
      }

      if (auto end = Answer(**detected, st)) {
        return *end;
      }
      state_.store(RunnerState::watching);
    }
  }

  // Handles one detected poll. Returns an exit reason if the session has to
  // end while answering.
  std::optional<ExitReason> Answer(const std::string &poll_id,
                                   std::stop_token st) {
    state_.store(RunnerState::answering);
    polls_.fetch_add(1, std::memory_order_relaxed);
    Emit(logging::LogLevel::poll, "detected " + poll_id);

    if (!clock_->WaitFor(config_.open_wait, st)) {
      return ExitReason::stop_requested;
    }

    retry::Backoff backoff(config_.retry);
    for (;;) {
      auto response = service_->SubmitAnswer(poll_id);
      if (response) {
        answers_.fetch_add(1, std::memory_order_relaxed);
        Emit(logging::LogLevel::success,
             "answered " + poll_id + " -> " + *response);
        return std::nullopt;
      }
      if (auto end =
              Recover("answer to " + poll_id, response.error(), backoff, st)) {
        return end;
      }
    }
  }

  // Applies the retry policy to a failed poll-service call. Returns nullopt
  // when the caller should try again, otherwise how the session ends.
  std::optional<ExitReason> Recover(const std::string &stage,
                                    const PollError &err,
                                    retry::Backoff &backoff,
                                    std::stop_token st) {
    if (err.kind != PollErrorKind::transient) {
      Emit(logging::LogLevel::error, stage + " failed (" +
                                         std::string(KindName(err.kind)) +
                                         "): " + err.message);
      return ExitReason::failed;
    }
    if (!backoff.RecordFailure()) {
      Emit(logging::LogLevel::error,
           stage + " failed after " + std::to_string(backoff.failures) +
               " attempts: " + err.message);
      return ExitReason::failed;
    }
    retries_.fetch_add(1, std::memory_order_relaxed);
    const auto delay = backoff.Next();
    Emit(logging::LogLevel::info,
         stage + " failed (attempt " + std::to_string(backoff.failures) + "/" +
             std::to_string(backoff.max_attempts) + "), retrying in " +
             std::to_string(delay.count()) + "ms: " + err.message);
    switch (Pause(delay, st)) {
    case PauseResult::stopped:
      return ExitReason::stop_requested;
    case PauseResult::deadline:
      return ExitReason::lifetime_elapsed;
    case PauseResult::elapsed:
      break;
    }
    return std::nullopt;
  }

  // Waits `d`, clipped so the session never sleeps past its deadline.
  PauseResult Pause(Clock::duration d, std::stop_token st) {
    const auto remaining = deadline_ - clock_->Now();
    const bool clipped = remaining < d;
    if (clipped) {
      d = std::max(remaining, Clock::duration::zero());
    }
    if (!clock_->WaitFor(d, st)) {
      return PauseResult::stopped;
    }
    return clipped ? PauseResult::deadline : PauseResult::elapsed;
  }

  // `terminal` marks the closing event, which a bounded channel must keep.
  void Emit(logging::LogLevel level, std::string message,
            bool terminal = false) {
    logging::LogEvent ev;
    ev.wall = std::chrono::system_clock::now();
    ev.offset = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->Now() - start_);
    ev.level = level;
    ev.message = std::move(message);
    if (terminal) {
      (void)channel_->PushTerminal(std::move(ev));
    } else {
      (void)channel_->Push(std::move(ev));
    }
  }

  const SessionConfig config_;
  std::unique_ptr<IPollService> service_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<logging::LogChannel> channel_;

  Clock::time_point start_{};
  Clock::time_point deadline_{};

  std::atomic<bool> started_{false};
  std::atomic<RunnerState> state_{RunnerState::idle};
  std::atomic<ExitReason> reason_{ExitReason::none};
  std::atomic<std::uint64_t> checks_{0};
  std::atomic<std::uint64_t> polls_{0};
  std::atomic<std::uint64_t> answers_{0};
  std::atomic<std::uint64_t> retries_{0};

  mutable std::mutex exit_mx_;
  std::condition_variable exit_cv_;
  bool exited_ = false;
};

} // namespace pollrun
