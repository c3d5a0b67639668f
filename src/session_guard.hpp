#pragma once

#include <memory>

#include "log.hpp"
#include "session_resolver.hpp"

// Holds a resolved session for the lifetime of a scope. An owned session
// is closed exactly once when the scope exits, however it exits; a
// borrowed one is left alone.
class SessionGuard {
public:
  SessionGuard(const SessionResolver& resolver,
               const SessionRequest& request,
               std::shared_ptr<Logger> logger = nullptr);
  ~SessionGuard();

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;
  SessionGuard(SessionGuard&&) = delete;
  SessionGuard& operator=(SessionGuard&&) = delete;

  Session& session() const { return *resolved_.session; }
  Session* operator->() const { return resolved_.session; }
  bool owns_session() const { return resolved_.owns_session(); }

private:
  ResolvedSession resolved_;
  std::shared_ptr<Logger> logger_;
};
