#pragma once

#include <memory>
#include <optional>
#include <string>

#include "credentials.hpp"
#include "log.hpp"
#include "session.hpp"
#include "settings_manager.hpp"

// Where a public operation gets its session from. First non-empty field
// wins: session, then server, then login; all empty means the configured
// default server.
struct SessionRequest {
  Session* session = nullptr; // borrowed, never closed by the operation
  std::optional<std::string> server;
  std::optional<ConnectionDescriptor> login;

  static SessionRequest borrow(Session& session);
  static SessionRequest named(std::string server);
  static SessionRequest with_login(ConnectionDescriptor login);
};

struct ResolvedSession {
  Session* session = nullptr;
  std::unique_ptr<Session> owned; // set when the resolver opened the session

  bool owns_session() const { return owned != nullptr; }
};

class SessionResolver {
public:
  // An empty decoder means: decode with the passphrase found in the
  // environment variable named by the `secret_env` setting.
  SessionResolver(std::shared_ptr<const SettingsManager> settings,
                  SessionConnector connector,
                  CredentialDecoder decoder = {},
                  std::shared_ptr<Logger> logger = nullptr);

  // Throws ConfigurationError for an unknown server, AuthenticationError
  // when the connector cannot log in.
  ResolvedSession resolve(const SessionRequest& request) const;

  ConnectionDescriptor descriptor_for_server(const std::string& name) const;

  const SettingsManager& settings() const { return *settings_; }

private:
  std::unique_ptr<Session> open(const ConnectionDescriptor& descriptor) const;

  std::shared_ptr<const SettingsManager> settings_;
  SessionConnector connector_;
  CredentialDecoder decoder_;
  std::shared_ptr<Logger> logger_;
};
