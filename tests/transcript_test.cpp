#include "pollrun/logging/transcript.hpp"
#include "pollrun/net/simulated_service.hpp"
#include "test_support.hpp"
#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace pollrun;
using namespace pollrun::testing;

namespace {

std::vector<std::string> ReadLines(const std::string &path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

std::string TempPath() {
  return "/tmp/pollrun_transcript_" + std::to_string(::getpid()) + ".log";
}

} // namespace

TEST_CASE("transcript appends tagged lines", "[transcript]") {
  const auto path = TempPath();
  std::remove(path.c_str());
  {
    logging::Transcript t(path);
    REQUIRE(t.OpenOk());
    std::vector<logging::LogEvent> batch(100);
    for (std::size_t i = 0; i < batch.size(); ++i) {
      batch[i].wall = std::chrono::system_clock::now();
      batch[i].level = logging::LogLevel::debug;
      batch[i].message = "line " + std::to_string(i);
    }
    CHECK(t.Append("[abcd1234]", batch));
    CHECK(t.AppendRaw("-- end --\n"));
  }
  {
    logging::Transcript again(path);
    CHECK(again.Append("[ffff0000]", {logging::LogEvent{}}));
  }

  auto lines = ReadLines(path);
  REQUIRE(lines.size() == 102);
  CHECK(lines[0].rfind("[abcd1234] [", 0) == 0);
  CHECK(Contains(lines[0], "[DEBUG] line 0"));
  CHECK(Contains(lines[99], "line 99"));
  CHECK(lines[100] == "-- end --");
  CHECK(lines[101].rfind("[ffff0000] ", 0) == 0);
  std::remove(path.c_str());
}

TEST_CASE("transcript reports an unwritable path", "[transcript]") {
  logging::Transcript t("/nonexistent-dir/pollrun.log");
  CHECK_FALSE(t.OpenOk());
  CHECK_FALSE(t.Error().empty());
  CHECK_FALSE(t.Append("[x]", {logging::LogEvent{}}));
}

TEST_CASE("simulated service opens polls on schedule", "[simulation]") {
  net::SimulationOptions opt;
  opt.open_every = 2;
  opt.latency = std::chrono::milliseconds(0);
  net::SimulatedPollService svc(opt);

  auto cfg = MakeConfig();
  REQUIRE(svc.Login(cfg.credentials));
  auto token = svc.FetchWatchToken();
  REQUIRE(token);
  CHECK(*token == "sim-cs3410");

  auto first = svc.DetectNewPoll(*token);
  REQUIRE(first);
  CHECK_FALSE(first->has_value());
  auto second = svc.DetectNewPoll(*token);
  REQUIRE(second);
  REQUIRE(second->has_value());
  CHECK(**second == "sim-poll-1");

  auto answer = svc.SubmitAnswer("sim-poll-1");
  REQUIRE(answer);
  CHECK(*answer == "option A (sim-poll-1)");

  auto rejected = svc.DetectNewPoll("forged");
  REQUIRE_FALSE(rejected);
  CHECK(rejected.error().kind == PollErrorKind::authentication);
}

TEST_CASE("simulated service can reject the login", "[simulation]") {
  net::SimulationOptions opt;
  opt.fail_login = true;
  opt.latency = std::chrono::milliseconds(0);
  net::SimulatedPollService svc(opt);

  auto login = svc.Login(MakeConfig().credentials);
  REQUIRE_FALSE(login);
  CHECK(login.error().kind == PollErrorKind::authentication);
  CHECK_FALSE(svc.FetchWatchToken());
}
