#pragma once

#include "pollrun/core/session.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pollrun {

// SessionRegistry — token -> SessionHandle for every session that has not
// been stopped and removed yet. Create one in main() and pass it by reference
// to everything that starts or reattaches to sessions; it lives until process
// exit.
// Threading model:
// - Register/Remove/ReapFinished take the lock exclusively, Lookup/Tokens/Size
//   share it, so every operation is linearizable
// - A handle returned by Lookup may belong to a runner that has already
//   exited; check SessionHandle::Alive() before relying on it
class SessionRegistry {
public:
  using HandlePtr = std::shared_ptr<SessionHandle>;

  SessionRegistry() = default;
  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // Rejects a token that is already present; the existing entry is kept.
  bool Register(const std::string &token, HandlePtr handle) {
    if (!handle) {
      return false;
    }
    std::unique_lock lk(mx_);
    return sessions_.emplace(token, std::move(handle)).second;
  }

  HandlePtr Lookup(const std::string &token) const {
    std::shared_lock lk(mx_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
      return nullptr;
    }
    return it->second;
  }

  // Removing an unknown token is a no-op.
  bool Remove(const std::string &token) {
    std::unique_lock lk(mx_);
    return sessions_.erase(token) > 0;
  }

  // Drops entries whose runner has exited on its own (lifetime elapsed or
  // failed) and returns them so the caller can report them.
  std::vector<HandlePtr> ReapFinished() {
    std::vector<HandlePtr> reaped;
    std::unique_lock lk(mx_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (!it->second->Alive()) {
        reaped.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
    return reaped;
  }

  std::vector<std::string> Tokens() const {
    std::shared_lock lk(mx_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto &[token, handle] : sessions_) {
      out.push_back(token);
    }
    return out;
  }

  std::size_t Size() const {
    std::shared_lock lk(mx_);
    return sessions_.size();
  }

private:
  mutable std::shared_mutex mx_;
  std::unordered_map<std::string, HandlePtr> sessions_;
};

} // namespace pollrun
