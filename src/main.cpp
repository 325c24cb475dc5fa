#include "pollrun/app/controller.hpp"
#include "pollrun/app/options.hpp"
#include "pollrun/core/registry.hpp"
#include "pollrun/logging/log_event.hpp"
#include "pollrun/logging/transcript.hpp"
#include "pollrun/net/simulated_service.hpp"
#include "pollrun/util/time.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

namespace asio = boost::asio;
using pollrun::app::Controller;
using pollrun::app::Options;
using pollrun::logging::LogLevel;

namespace {

std::string ShortTag(const std::string &token) {
  return "[" + token.substr(0, 8) + "]";
}

// Console
// Threading model:
// - Everything below runs on the io_context thread (main thread)
// - A steady_timer drains the attached session every refresh period,
//   independent of the runners' own timing
// - stdin commands and SIGINT/SIGTERM arrive as async completions on the same
//   io_context, so the controller is never used concurrently
class Console {
public:
  Console(asio::io_context &ioc, Controller &controller, const Options &opt,
          pollrun::logging::Transcript *transcript)
      : controller_(controller), opt_(opt),
        transcript_(transcript), timer_(ioc), signals_(ioc, SIGINT, SIGTERM),
        stdin_(ioc) {}

  bool Start() {
    if (!StartSession()) {
      return false;
    }
    signals_.async_wait([this](const boost::system::error_code &ec, int sig) {
      if (ec) {
        return;
      }
      std::cerr << "[console] signal " << sig << ", stopping sessions\n";
      Shutdown();
    });
    boost::system::error_code ec;
    stdin_.assign(::dup(STDIN_FILENO), ec);
    if (ec) {
      // stdin is a regular file or closed: run without interactive commands.
      std::cerr << "[console] stdin error: " << ec.message() << "\n";
    } else {
      ReadCommand();
    }
    ArmRefresh();
    return true;
  }

  int ExitCode() const { return failed_ ? 1 : 0; }

private:
  bool StartSession() {
    auto started = controller_.Start(opt_.session);
    if (!started) {
      for (const auto &problem : started.error()) {
        std::cerr << "[console] start error: " << problem << "\n";
      }
      return false;
    }
    std::cout << "session " << *started << " started ("
              << pollrun::Describe(opt_.session) << ")\n";
    return true;
  }

  void ArmRefresh() {
    timer_.expires_after(opt_.refresh);
    timer_.async_wait([this](const boost::system::error_code &ec) {
      if (ec || stopping_) {
        return;
      }
      Tick();
      if (!stopping_) {
        ArmRefresh();
      }
    });
  }

  void Tick() {
    for (const auto &s : controller_.Reap()) {
      if (s.state == pollrun::RunnerState::failed) {
        failed_ = true;
      }
      std::ostringstream line;
      line << ShortTag(s.token) << " session ended: "
           << pollrun::StateName(s.state) << " ("
           << pollrun::ReasonName(s.reason) << "), answered "
           << s.stats.answers << " of " << s.stats.polls_detected
           << " polls\n";
      std::cout << line.str();
      Record(line.str());
    }
    Render();
    if (controller_.List().empty()) {
      Shutdown();
    }
  }

  void Render() {
    bool printed = false;
    for (const auto &batch : controller_.PollBatches()) {
      const std::string tag = ShortTag(batch.token);
      for (const auto &ev : batch.events) {
        if (ev.level == LogLevel::debug && !opt_.verbose) {
          continue;
        }
        std::cout << tag << " " << pollrun::logging::FormatLine(ev) << "\n";
        printed = true;
      }
      if (transcript_ != nullptr && !transcript_->Append(tag, batch.events)) {
        std::cerr << "[transcript] write error: " << transcript_->Error()
                  << "\n";
      }
    }
    if (printed) {
      std::cout.flush();
    }
  }

  void Record(const std::string &text) {
    if (transcript_ != nullptr && !transcript_->AppendRaw(text)) {
      std::cerr << "[transcript] write error: " << transcript_->Error()
                << "\n";
    }
  }

  void ReadCommand() {
    asio::async_read_until(
        stdin_, input_, '\n',
        [this](const boost::system::error_code &ec, std::size_t) {
          if (ec || stopping_) {
            return;
          }
          std::istream is(&input_);
          std::string line;
          std::getline(is, line);
          Handle(boost::algorithm::trim_copy(line));
          if (!stopping_) {
            ReadCommand();
          }
        });
  }

  void Handle(const std::string &line) {
    std::istringstream in(line);
    std::string cmd;
    std::string arg;
    in >> cmd >> arg;
    if (cmd.empty()) {
      return;
    }
    if (cmd == "start") {
      (void)StartSession();
    } else if (cmd == "attach") {
      Render();
      if (controller_.Attach(arg)) {
        std::cout << "attached to " << arg << "\n";
      } else {
        std::cout << "no session " << arg << "\n";
      }
    } else if (cmd == "detach") {
      Render();
      controller_.Detach();
    } else if (cmd == "stop") {
      std::string token = arg;
      if (token.empty() && controller_.AttachedToken()) {
        token = *controller_.AttachedToken();
      }
      auto result = controller_.Stop(token);
      if (!result) {
        std::cout << "no session " << token << "\n";
      } else if (*result == pollrun::StopResult::grace_elapsed) {
        std::cout << ShortTag(token)
                  << " stop requested; session still finishing a request\n";
      } else {
        std::cout << ShortTag(token) << " stopped\n";
      }
      Render();
    } else if (cmd == "list") {
      for (const auto &s : controller_.List()) {
        std::cout << s.token << " " << pollrun::StateName(s.state)
                  << (s.alive ? "" : " (exited)") << " checks=" << s.stats.checks
                  << " answered=" << s.stats.answers << " " << s.description
                  << "\n";
      }
    } else if (cmd == "quit" || cmd == "exit") {
      Shutdown();
    } else {
      std::cout << "commands: start, attach TOKEN, detach, stop [TOKEN], "
                   "list, quit\n";
    }
  }

  void Shutdown() {
    if (stopping_) {
      return;
    }
    stopping_ = true;
    for (const auto &[token, result] : controller_.StopAll()) {
      if (result == pollrun::StopResult::grace_elapsed) {
        std::cerr << "[console] " << ShortTag(token)
                  << " did not exit within the grace period\n";
      }
    }
    Render();
    boost::system::error_code ignored;
    timer_.cancel();
    signals_.cancel(ignored);
    if (stdin_.is_open()) {
      stdin_.close(ignored);
    }
  }

  Controller &controller_;
  const Options &opt_;
  pollrun::logging::Transcript *transcript_;
  asio::steady_timer timer_;
  asio::signal_set signals_;
  asio::posix::stream_descriptor stdin_;
  asio::streambuf input_;
  bool stopping_ = false;
  bool failed_ = false;
};

} // namespace

int main(int argc, char **argv) {
  Options opt = pollrun::app::ParseArgs(argc, argv);
  if (opt.help) {
    std::cout << pollrun::app::kUsage;
    return 0;
  }
  if (!opt.errors.empty()) {
    for (const auto &e : opt.errors) {
      std::cerr << "[options] " << e << "\n";
    }
    std::cerr << pollrun::app::kUsage;
    return 1;
  }

  std::optional<pollrun::logging::Transcript> transcript;
  if (!opt.transcript.empty()) {
    transcript.emplace(opt.transcript);
    if (!transcript->OpenOk()) {
      std::cerr << "[transcript] open error: " << transcript->Path() << ": "
                << transcript->Error() << "\n";
      return 1;
    }
  }

  // Lives until main returns; every controller interaction goes through it.
  pollrun::SessionRegistry registry;

  pollrun::app::ServiceFactory factory =
      [&opt](const pollrun::SessionConfig &)
      -> std::unique_ptr<pollrun::IPollService> {
    if (!opt.simulate) {
      return nullptr;
    }
    return std::make_unique<pollrun::net::SimulatedPollService>(opt.simulation);
  };
  Controller controller(registry, factory);

  asio::io_context ioc;
  Console console(ioc, controller, opt,
                  transcript ? &*transcript : nullptr);
  if (!console.Start()) {
    if (!opt.simulate) {
      std::cerr << "[console] no web adapter is linked into this build; "
                   "run with --simulate\n";
    }
    return 1;
  }
  ioc.run();
  return console.ExitCode();
}
