#pragma once

#include "pollrun/core/clock.hpp"
#include "pollrun/core/config.hpp"
#include "pollrun/core/poll_service.hpp"
#include "pollrun/core/registry.hpp"
#include "pollrun/core/runner.hpp"
#include "pollrun/core/session.hpp"
#include "pollrun/logging/log_event.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pollrun::app {

using ServiceFactory =
    std::function<std::unique_ptr<IPollService>(const SessionConfig &)>;

struct SessionSummary {
  std::string token;
  RunnerState state = RunnerState::idle;
  ExitReason reason = ExitReason::none;
  bool alive = false;
  RunnerStats stats;
  std::string description;
};

// Events drained from one session, tagged with its token.
struct EventBatch {
  std::string token;
  std::vector<logging::LogEvent> events;
};

// Controller — one operator interaction with the session registry: start a
// session, attach to one by token, drain its log for display, stop it.
// Several controllers may share a registry (one per console, per request,
// per reload); a single controller is used from one thread.
// The controller keeps only the attached token, never the handle, so every
// call sees the registry's current view.
class Controller {
public:
  Controller(SessionRegistry &registry, ServiceFactory factory,
             std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>())
      : registry_(registry), factory_(std::move(factory)),
        clock_(std::move(clock)) {}

  // Validates, starts, registers and attaches. On failure returns the list
  // of problems and starts nothing.
  std::expected<std::string, std::vector<std::string>>
  Start(const SessionConfig &cfg) {
    auto problems = Validate(cfg);
    if (!problems.empty()) {
      return std::unexpected(std::move(problems));
    }
    auto service = factory_(cfg);
    if (!service) {
      return std::unexpected(
          std::vector<std::string>{"no poll service available"});
    }
    auto handle = pollrun::Start(cfg, std::move(service), clock_);
    const std::string token = handle->Token();
    if (!registry_.Register(token, handle)) {
      (void)handle->Stop();
      return std::unexpected(
          std::vector<std::string>{"session token collision: " + token});
    }
    Attach(token);
    return token;
  }

  // A token the registry does not know leaves the controller detached.
  bool Attach(const std::string &token) {
    if (!registry_.Lookup(token)) {
      return false;
    }
    attached_ = token;
    return true;
  }

  void Detach() { attached_.reset(); }

  const std::optional<std::string> &AttachedToken() const { return attached_; }

  std::shared_ptr<SessionHandle> Attached() const {
    if (!attached_) {
      return nullptr;
    }
    return registry_.Lookup(*attached_);
  }

  // Drains the attached session's channel. If another controller removed the
  // session in the meantime, detaches. Events kept back from sessions this
  // controller stopped or reaped come first, under their own token.
  std::vector<EventBatch> PollBatches() {
    std::vector<EventBatch> out = std::exchange(pending_, {});
    auto handle = Attached();
    if (!handle) {
      attached_.reset();
      return out;
    }
    auto drained = handle->Channel()->Drain();
    if (!drained.empty()) {
      out.push_back(EventBatch{*attached_, std::move(drained)});
    }
    return out;
  }

  std::vector<logging::LogEvent> Poll() {
    std::vector<logging::LogEvent> out;
    for (auto &batch : PollBatches()) {
      out.insert(out.end(), std::make_move_iterator(batch.events.begin()),
                 std::make_move_iterator(batch.events.end()));
    }
    return out;
  }

  // Stops and unregisters a session. nullopt if the token is unknown.
  template <typename Rep, typename Period>
  std::optional<StopResult> Stop(const std::string &token,
                                 std::chrono::duration<Rep, Period> grace) {
    auto handle = registry_.Lookup(token);
    if (!handle) {
      return std::nullopt;
    }
    const StopResult result = handle->Stop(grace);
    (void)registry_.Remove(token);
    Release(*handle);
    return result;
  }

  std::optional<StopResult> Stop(const std::string &token) {
    return Stop(token, kStopGrace);
  }

  std::vector<std::pair<std::string, StopResult>> StopAll() {
    std::vector<std::pair<std::string, StopResult>> results;
    for (const auto &token : registry_.Tokens()) {
      if (auto r = Stop(token)) {
        results.emplace_back(token, *r);
      }
    }
    return results;
  }

  // Unregisters sessions whose runner ended on its own and returns their
  // summaries.
  std::vector<SessionSummary> Reap() {
    std::vector<SessionSummary> out;
    for (auto &handle : registry_.ReapFinished()) {
      out.push_back(Summarize(*handle));
      Release(*handle);
    }
    return out;
  }

  std::vector<SessionSummary> List() const {
    std::vector<SessionSummary> out;
    for (const auto &token : registry_.Tokens()) {
      if (auto handle = registry_.Lookup(token)) {
        out.push_back(Summarize(*handle));
      }
    }
    return out;
  }

  static SessionSummary Summarize(const SessionHandle &handle) {
    const auto &runner = *handle.Runner();
    SessionSummary s;
    s.token = handle.Token();
    s.state = runner.State();
    s.reason = runner.Reason();
    s.alive = handle.Alive();
    s.stats = runner.Stats();
    s.description = Describe(runner.Config());
    return s;
  }

private:
  // Keeps the final events of the attached session for the next Poll.
  void Release(SessionHandle &handle) {
    if (attached_ && *attached_ == handle.Token()) {
      auto rest = handle.Channel()->Drain();
      if (!rest.empty()) {
        pending_.push_back(EventBatch{handle.Token(), std::move(rest)});
      }
      attached_.reset();
    }
  }

  SessionRegistry &registry_;
  ServiceFactory factory_;
  std::shared_ptr<Clock> clock_;
  std::optional<std::string> attached_;
  std::vector<EventBatch> pending_;
};

} // namespace pollrun::app
