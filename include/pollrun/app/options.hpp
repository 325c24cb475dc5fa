#pragma once

#include "pollrun/core/config.hpp"
#include "pollrun/net/simulated_service.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace pollrun::app {

struct Options {
  SessionConfig session;
  std::chrono::milliseconds refresh{2000};
  std::string transcript;
  bool verbose = false;
  bool simulate = false;
  bool help = false;
  net::SimulationOptions simulation;
  std::vector<std::string> errors;
};

inline constexpr const char *kUsage =
    R"(usage: pollrun [options]

Session:
  -u, --user NAME         account identity (env EMAIL)
  -p, --password SECRET   account secret (env PASSWORD)
  -H, --host NAME         poll session to watch (env HOST)
  -l, --login-type MODE   standard|pollev or institutional-sso|sso|uw
  -t, --lifetime SECONDS  session lifetime (default 4800)
      --closed-wait SEC   idle interval between poll checks (default 5)
      --open-wait SEC     delay before answering a poll (default 5)
      --max-retries N     attempts for a failing poll check/answer (default 5)
      --log-capacity N    bound the per-session log buffer (default unbounded)

Console:
  -r, --refresh MS        log refresh period (default 2000)
  -o, --transcript PATH   append rendered log lines to PATH
  -v, --verbose           show debug lines
      --simulate          use the built-in simulated poll service
      --sim-open-every N  simulated service opens a poll every N checks
      --sim-fail-login    simulated service rejects the login
  -h, --help

Commands on stdin: start, attach TOKEN, detach, stop [TOKEN], list, quit
)";

inline std::string EnvOr(const char *name, std::string fallback) {
  const char *v = std::getenv(name);
  return v != nullptr ? std::string(v) : fallback;
}

// Whole decimal number, or nullopt plus an error naming the flag.
inline std::optional<int> ParseInt(const std::string &flag, const char *text,
                                   std::vector<std::string> &errors) {
  int value = 0;
  const char *end = text + std::strlen(text);
  auto [ptr, ec] = std::from_chars(text, end, value);
  if (ec == std::errc::result_out_of_range) {
    errors.push_back(flag + " value '" + text + "' is out of range");
    return std::nullopt;
  }
  if (ec != std::errc() || ptr != end) {
    errors.push_back(flag + " expects a whole number, got '" + text + "'");
    return std::nullopt;
  }
  return value;
}

inline Options ParseArgs(int argc, char **argv) {
  Options opt;
  auto &cfg = opt.session;
  cfg.credentials.identity = EnvOr("EMAIL", "");
  cfg.credentials.secret = EnvOr("PASSWORD", "");
  cfg.credentials.host = EnvOr("HOST", "");

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    if ((a == "-u" || a == "--user") && has_value)
      cfg.credentials.identity = argv[++i];
    else if ((a == "-p" || a == "--password") && has_value)
      cfg.credentials.secret = argv[++i];
    else if ((a == "-H" || a == "--host") && has_value)
      cfg.credentials.host = argv[++i];
    else if ((a == "-l" || a == "--login-type") && has_value) {
      std::string mode = argv[++i];
      if (auto parsed = ParseLoginMode(mode)) {
        cfg.credentials.login_mode = *parsed;
      } else {
        opt.errors.push_back("unknown login type '" + mode + "'");
      }
    } else if ((a == "-t" || a == "--lifetime") && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        cfg.lifetime = std::chrono::seconds(*v);
    } else if (a == "--closed-wait" && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        cfg.closed_wait = std::chrono::seconds(*v);
    } else if (a == "--open-wait" && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        cfg.open_wait = std::chrono::seconds(*v);
    } else if (a == "--max-retries" && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        cfg.retry.max_attempts = *v;
    } else if (a == "--log-capacity" && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        cfg.log_capacity = static_cast<std::size_t>(std::max(0, *v));
    } else if ((a == "-r" || a == "--refresh") && has_value) {
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        opt.refresh = std::chrono::milliseconds(std::max(100, *v));
    } else if ((a == "-o" || a == "--transcript") && has_value)
      opt.transcript = argv[++i];
    else if (a == "-v" || a == "--verbose")
      opt.verbose = true;
    else if (a == "--simulate")
      opt.simulate = true;
    else if (a == "--sim-open-every" && has_value) {
      opt.simulate = true;
      if (auto v = ParseInt(a, argv[++i], opt.errors))
        opt.simulation.open_every = std::max(0, *v);
    } else if (a == "--sim-fail-login") {
      opt.simulate = true;
      opt.simulation.fail_login = true;
    } else if (a == "-h" || a == "--help")
      opt.help = true;
    else
      opt.errors.push_back("unrecognised argument '" + a + "'");
  }

  if (!opt.help) {
    for (auto &problem : Validate(cfg)) {
      opt.errors.push_back(std::move(problem));
    }
  }
  return opt;
}

} // namespace pollrun::app
