#pragma once

#include "pollrun/core/clock.hpp"
#include "pollrun/core/config.hpp"
#include "pollrun/core/poll_service.hpp"
#include "pollrun/core/runner.hpp"
#include "pollrun/logging/log_channel.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pollrun {

enum class StopResult { exited, grace_elapsed };

inline constexpr std::chrono::seconds kStopGrace{5};

// 32 lowercase hex characters from a random (v4) UUID. Safe to carry in a URL
// or on a command line.
inline std::string NewSessionToken() {
  thread_local boost::uuids::random_generator gen;
  std::string s = boost::uuids::to_string(gen());
  s.erase(std::remove(s.begin(), s.end(), '-'), s.end());
  return s;
}

// SessionHandle — a started session: its token, its runner and the thread
// executing it. Shared between the registry and whoever started it.
// Threading model:
// - The runner thread owns shared references to the runner (and through it
//   to the channel and service), so it stays valid if the handle goes away
// - Stop() may be called from any thread, any number of times
class SessionHandle {
public:
  SessionHandle(std::string token, std::shared_ptr<SessionRunner> runner)
      : token_(std::move(token)), runner_(std::move(runner)) {}

  ~SessionHandle() {
    thread_.request_stop();
    if (thread_.joinable()) {
      if (runner_->Alive()) {
        thread_.detach();
      } else {
        thread_.join();
      }
    }
  }

  SessionHandle(const SessionHandle &) = delete;
  SessionHandle &operator=(const SessionHandle &) = delete;

  const std::string &Token() const { return token_; }
  const std::shared_ptr<SessionRunner> &Runner() const { return runner_; }
  const std::shared_ptr<logging::LogChannel> &Channel() const {
    return runner_->Channel();
  }

  // False once the runner has exited, for whatever reason.
  bool Alive() const { return runner_->Alive(); }

  // Requests a cooperative stop and waits at most `grace` for the runner to
  // exit. A runner still inside a poll-service call after the grace period
  // keeps running on a detached thread until that call returns.
  template <typename Rep, typename Period>
  StopResult Stop(std::chrono::duration<Rep, Period> grace) {
    std::lock_guard<std::mutex> lk(mx_);
    thread_.request_stop();
    if (!runner_->WaitForExit(grace)) {
      if (thread_.joinable()) {
        thread_.detach();
      }
      return StopResult::grace_elapsed;
    }
    if (thread_.joinable()) {
      thread_.join();
    }
    return StopResult::exited;
  }

  StopResult Stop() { return Stop(kStopGrace); }

private:
  friend std::shared_ptr<SessionHandle>
  Start(SessionConfig config, std::unique_ptr<IPollService> service,
        std::shared_ptr<Clock> clock);

  void Launch() {
    thread_ = std::jthread(
        [runner = runner_](std::stop_token st) { runner->Run(st); });
  }

  std::string token_;
  std::shared_ptr<SessionRunner> runner_;
  std::mutex mx_;
  std::jthread thread_;
};

// Starts a session on its own thread and returns without waiting for any
// network activity.
inline std::shared_ptr<SessionHandle>
Start(SessionConfig config, std::unique_ptr<IPollService> service,
      std::shared_ptr<Clock> clock) {
  auto channel = std::make_shared<logging::LogChannel>(config.log_capacity);
  auto runner = std::make_shared<SessionRunner>(
      std::move(config), std::move(service), std::move(clock),
      std::move(channel));
  auto handle =
      std::make_shared<SessionHandle>(NewSessionToken(), std::move(runner));
  handle->Launch();
  return handle;
}

inline std::shared_ptr<SessionHandle>
Start(SessionConfig config, std::unique_ptr<IPollService> service) {
  return Start(std::move(config), std::move(service),
               std::make_shared<SteadyClock>());
}

template <typename Rep, typename Period>
inline StopResult Stop(SessionHandle &handle,
                       std::chrono::duration<Rep, Period> grace) {
  return handle.Stop(grace);
}

inline StopResult Stop(SessionHandle &handle) { return handle.Stop(); }

} // namespace pollrun
