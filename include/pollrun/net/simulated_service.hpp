#pragma once

#include "pollrun/core/config.hpp"
#include "pollrun/core/poll_service.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace pollrun::net {

struct SimulationOptions {
  // Open a new poll on every Nth check; 0 never opens one.
  int open_every = 0;
  bool fail_login = false;
  // Simulated round-trip time of every call.
  std::chrono::milliseconds latency{150};
  std::string response = "option A";
};

// SimulatedPollService — stands in for the polling service's web API when
// the CLI runs with --simulate. Every call blocks for `latency`, like a real
// request would, and polls open on a fixed schedule.
class SimulatedPollService : public IPollService {
public:
  explicit SimulatedPollService(SimulationOptions opt) : opt_(std::move(opt)) {}

  PollStatus Login(const Credentials &credentials) override {
    RoundTrip();
    if (opt_.fail_login) {
      return MakeError(PollErrorKind::authentication,
                       "invalid credentials for " + credentials.identity);
    }
    host_ = credentials.host;
    logged_in_ = true;
    return {};
  }

  PollResult<std::string> FetchWatchToken() override {
    RoundTrip();
    if (!logged_in_) {
      return MakeError(PollErrorKind::authentication, "not logged in");
    }
    return "sim-" + host_;
  }

  PollResult<std::optional<std::string>>
  DetectNewPoll(const std::string &watch_token) override {
    RoundTrip();
    if (watch_token != "sim-" + host_) {
      return MakeError(PollErrorKind::authentication, "watch token rejected");
    }
    ++checks_;
    if (opt_.open_every > 0 && checks_ % opt_.open_every == 0) {
      return std::optional<std::string>("sim-poll-" + std::to_string(++opened_));
    }
    return std::optional<std::string>{};
  }

  PollResult<std::string> SubmitAnswer(const std::string &poll_id) override {
    RoundTrip();
    return opt_.response + " (" + poll_id + ")";
  }

private:
  void RoundTrip() const {
    if (opt_.latency.count() > 0) {
      std::this_thread::sleep_for(opt_.latency);
    }
  }

  SimulationOptions opt_;
  std::string host_;
  bool logged_in_ = false;
  std::uint64_t checks_ = 0;
  std::uint64_t opened_ = 0;
};

} // namespace pollrun::net
