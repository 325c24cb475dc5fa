#include "pollrun/app/options.hpp"
#include "pollrun/core/config.hpp"
#include "pollrun/net/backoff.hpp"
#include "pollrun/util/time.hpp"
#include "test_support.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <string>
#include <vector>

using namespace pollrun;
using namespace pollrun::testing;

namespace {

app::Options Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "pollrun");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return app::ParseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("login modes accept canonical names and aliases", "[config]") {
  CHECK(ParseLoginMode("standard") == LoginMode::standard);
  CHECK(ParseLoginMode("PollEv") == LoginMode::standard);
  CHECK(ParseLoginMode("institutional-sso") == LoginMode::institutional_sso);
  CHECK(ParseLoginMode(" uw ") == LoginMode::institutional_sso);
  CHECK(ParseLoginMode("SSO") == LoginMode::institutional_sso);
  CHECK_FALSE(ParseLoginMode("oauth"));
  CHECK(LoginModeName(LoginMode::institutional_sso) == "institutional-sso");
}

TEST_CASE("validation lists every problem", "[config]") {
  CHECK(Validate(MakeConfig()).empty());

  SessionConfig bad;
  bad.lifetime = std::chrono::seconds(0);
  bad.closed_wait = std::chrono::seconds(-1);
  bad.open_wait = std::chrono::seconds(-1);
  bad.retry.max_attempts = 0;
  auto problems = Validate(bad);
  CHECK(problems.size() == 7);
}

TEST_CASE("defaults match an eighty minute session", "[config]") {
  SessionConfig cfg;
  CHECK(cfg.lifetime == std::chrono::seconds(4800));
  CHECK(cfg.closed_wait == std::chrono::seconds(5));
  CHECK(cfg.open_wait == std::chrono::seconds(5));
  CHECK(cfg.log_capacity == 0);
  CHECK(cfg.credentials.login_mode == LoginMode::standard);
}

TEST_CASE("describe never prints the secret", "[config]") {
  const auto text = Describe(MakeConfig(4800s));
  CHECK(Contains(text, "user=student@example.edu"));
  CHECK(Contains(text, "lifetime=1h20m00s"));
  CHECK_FALSE(Contains(text, "hunter2"));
}

TEST_CASE("backoff doubles up to the cap and enforces the budget",
          "[config]") {
  RetryPolicy policy;
  policy.max_attempts = 3;
  policy.initial_backoff = std::chrono::milliseconds(500);
  policy.max_backoff = std::chrono::milliseconds(1500);
  retry::Backoff b(policy);
  CHECK(b.Next() == std::chrono::milliseconds(500));
  CHECK(b.Next() == std::chrono::milliseconds(1000));
  CHECK(b.Next() == std::chrono::milliseconds(1500));
  CHECK(b.Next() == std::chrono::milliseconds(1500));

  CHECK(b.RecordFailure());
  CHECK(b.RecordFailure());
  CHECK_FALSE(b.RecordFailure());
  b.Reset();
  CHECK(b.failures == 0);
  CHECK(b.Next() == std::chrono::milliseconds(500));
}

TEST_CASE("durations render compactly", "[config]") {
  CHECK(timeutil::FormatDuration(std::chrono::seconds(45)) == "45s");
  CHECK(timeutil::FormatDuration(std::chrono::seconds(185)) == "3m05s");
  CHECK(timeutil::FormatDuration(std::chrono::seconds(4800)) == "1h20m00s");
  CHECK(timeutil::FormatDuration(std::chrono::seconds(-3)) == "0s");
}

TEST_CASE("command line flags fill the session config", "[options]") {
  auto opt = Parse({"-u", "a@b.edu", "-p", "pw", "-H", "cs101", "-l", "uw",
                    "-t", "600", "--closed-wait", "3", "--open-wait", "1",
                    "--max-retries", "4", "-v", "--sim-open-every", "2"});
  CHECK(opt.errors.empty());
  CHECK(opt.session.credentials.identity == "a@b.edu");
  CHECK(opt.session.credentials.host == "cs101");
  CHECK(opt.session.credentials.login_mode == LoginMode::institutional_sso);
  CHECK(opt.session.lifetime == std::chrono::seconds(600));
  CHECK(opt.session.closed_wait == std::chrono::seconds(3));
  CHECK(opt.session.open_wait == std::chrono::seconds(1));
  CHECK(opt.session.retry.max_attempts == 4);
  CHECK(opt.verbose);
  CHECK(opt.simulate);
  CHECK(opt.simulation.open_every == 2);
}

TEST_CASE("credentials fall back to the environment", "[options]") {
  ::setenv("EMAIL", "env@b.edu", 1);
  ::setenv("PASSWORD", "envpw", 1);
  ::setenv("HOST", "envhost", 1);
  auto opt = Parse({"--host", "flaghost"});
  ::unsetenv("EMAIL");
  ::unsetenv("PASSWORD");
  ::unsetenv("HOST");

  CHECK(opt.errors.empty());
  CHECK(opt.session.credentials.identity == "env@b.edu");
  CHECK(opt.session.credentials.secret == "envpw");
  CHECK(opt.session.credentials.host == "flaghost");
}

TEST_CASE("bad arguments are collected, not fatal", "[options]") {
  ::unsetenv("EMAIL");
  ::unsetenv("PASSWORD");
  ::unsetenv("HOST");
  auto opt = Parse({"--login-type", "oauth", "--bogus"});
  CHECK(opt.errors.size() == 5);
  CHECK(Contains(opt.errors[0], "unknown login type 'oauth'"));
  CHECK(Contains(opt.errors[1], "unrecognised argument '--bogus'"));

  auto help = Parse({"--help"});
  CHECK(help.help);
  CHECK(help.errors.empty());
}

TEST_CASE("numeric flags reject text and overflow", "[options]") {
  auto opt = Parse({"-u", "a@b.edu", "-p", "pw", "-H", "cs101", "-t", "abc",
                    "--closed-wait", "99999999999", "--open-wait", "3x"});
  REQUIRE(opt.errors.size() == 3);
  CHECK(opt.errors[0] == "-t expects a whole number, got 'abc'");
  CHECK(opt.errors[1] == "--closed-wait value '99999999999' is out of range");
  CHECK(opt.errors[2] == "--open-wait expects a whole number, got '3x'");
  CHECK(opt.session.lifetime == std::chrono::seconds(4800));
  CHECK(opt.session.closed_wait == std::chrono::seconds(5));
  CHECK(opt.session.open_wait == std::chrono::seconds(5));
}
