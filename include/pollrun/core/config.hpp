#pragma once

#include "pollrun/util/time.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pollrun {

enum class LoginMode { standard, institutional_sso };

inline std::string_view LoginModeName(LoginMode mode) {
  return mode == LoginMode::standard ? "standard" : "institutional-sso";
}

// Accepts the canonical names plus the short forms operators tend to type
// ("pollev" for the service's own login, "uw"/"sso" for single sign-on).
inline std::optional<LoginMode> ParseLoginMode(std::string_view text) {
  std::string s = boost::algorithm::trim_copy(std::string(text));
  if (boost::algorithm::iequals(s, "standard") ||
      boost::algorithm::iequals(s, "pollev")) {
    return LoginMode::standard;
  }
  if (boost::algorithm::iequals(s, "institutional-sso") ||
      boost::algorithm::iequals(s, "sso") || boost::algorithm::iequals(s, "uw")) {
    return LoginMode::institutional_sso;
  }
  return std::nullopt;
}

struct Credentials {
  std::string identity;
  std::string secret;
  std::string host;
  LoginMode login_mode = LoginMode::standard;
};

// Retry schedule for transient failures while watching. Failures are counted
// per step and reset by the next success.
struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{30000};
};

// SessionConfig — everything a runner needs, fixed at start. The runner keeps
// its own const copy, so readers never need synchronization.
struct SessionConfig {
  Credentials credentials;
  std::chrono::seconds lifetime{4800};
  std::chrono::seconds closed_wait{5};
  std::chrono::seconds open_wait{5};
  RetryPolicy retry;
  // 0 keeps the log channel unbounded.
  std::size_t log_capacity = 0;
};

inline bool IsBlank(const std::string &s) {
  return boost::algorithm::trim_copy(s).empty();
}

// Returns one message per problem; empty means the config is usable.
inline std::vector<std::string> Validate(const SessionConfig &cfg) {
  std::vector<std::string> problems;
  if (IsBlank(cfg.credentials.identity)) {
    problems.emplace_back("identity (user/email) is required");
  }
  if (IsBlank(cfg.credentials.secret)) {
    problems.emplace_back("secret (password) is required");
  }
  if (IsBlank(cfg.credentials.host)) {
    problems.emplace_back("host is required");
  }
  if (cfg.lifetime <= std::chrono::seconds::zero()) {
    problems.emplace_back("lifetime must be positive");
  }
  if (cfg.closed_wait <= std::chrono::seconds::zero()) {
    problems.emplace_back("closed wait must be positive");
  }
  if (cfg.open_wait < std::chrono::seconds::zero()) {
    problems.emplace_back("open wait must not be negative");
  }
  if (cfg.retry.max_attempts < 1) {
    problems.emplace_back("max retry attempts must be at least 1");
  }
  if (cfg.retry.initial_backoff <= std::chrono::milliseconds::zero() ||
      cfg.retry.max_backoff < cfg.retry.initial_backoff) {
    problems.emplace_back("backoff bounds are inconsistent");
  }
  return problems;
}

// Summary safe to print: never includes the secret.
inline std::string Describe(const SessionConfig &cfg) {
  std::string out;
  out += "user=" + cfg.credentials.identity;
  out += " host=" + cfg.credentials.host;
  out += " login=" + std::string(LoginModeName(cfg.credentials.login_mode));
  out += " lifetime=" + timeutil::FormatDuration(cfg.lifetime);
  out += " closed_wait=" + timeutil::FormatDuration(cfg.closed_wait);
  out += " open_wait=" + timeutil::FormatDuration(cfg.open_wait);
  return out;
}

} // namespace pollrun
