#include "session_guard.hpp"

#include <exception>

SessionGuard::SessionGuard(const SessionResolver& resolver,
                           const SessionRequest& request,
                           std::shared_ptr<Logger> logger)
  : resolved_(resolver.resolve(request)),
    logger_(std::move(logger)) {}

SessionGuard::~SessionGuard() {
  if(!resolved_.owned) return;
  try {
    resolved_.owned->close();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Closing session failed: {}", e.what());
  }
  resolved_.session = nullptr;
  resolved_.owned.reset();
}
