#include "session_resolver.hpp"

#include <cstdlib>
#include <stdexcept>

#include "errors.hpp"

SessionRequest SessionRequest::borrow(Session& session) {
  SessionRequest request;
  request.session = &session;
  return request;
}

SessionRequest SessionRequest::named(std::string server) {
  SessionRequest request;
  request.server = std::move(server);
  return request;
}

SessionRequest SessionRequest::with_login(ConnectionDescriptor login) {
  SessionRequest request;
  request.login = std::move(login);
  return request;
}

SessionResolver::SessionResolver(std::shared_ptr<const SettingsManager> settings,
                                 SessionConnector connector,
                                 CredentialDecoder decoder,
                                 std::shared_ptr<Logger> logger)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    connector_(std::move(connector)),
    decoder_(std::move(decoder)),
    logger_(std::move(logger)) {
  if(!connector_) throw std::invalid_argument("SessionResolver needs a connector");
  if(!decoder_) {
    const char* passphrase = std::getenv(settings_->get<std::string>("secret_env").c_str());
    decoder_ = make_credential_decoder(passphrase ? passphrase : "");
  }
}

ConnectionDescriptor SessionResolver::descriptor_for_server(const std::string& name) const {
  auto servers = settings_->get<nlohmann::json>("servers");
  if(!servers.is_object() || !servers.contains(name)) {
    throw ConfigurationError("server '" + name + "' is not configured");
  }
  return descriptor_from_login(decoder_(servers.at(name)));
}

std::unique_ptr<Session> SessionResolver::open(const ConnectionDescriptor& descriptor) const {
  log_debug(logger_.get(), "Opening session to {}@{}:{} (tls={})",
            descriptor.user, descriptor.host, descriptor.port, descriptor.use_tls);
  std::unique_ptr<Session> session;
  try {
    session = connector_(descriptor);
  } catch(const BulkFtpError&) {
    throw;
  } catch(const std::exception& e) {
    throw AuthenticationError("cannot connect to " + descriptor.host + ": " + e.what());
  }
  if(!session) throw AuthenticationError("connector returned no session for " + descriptor.host);
  return session;
}

ResolvedSession SessionResolver::resolve(const SessionRequest& request) const {
  ResolvedSession out;
  if(request.session) {
    out.session = request.session;
    return out;
  }
  if(request.server) {
    out.owned = open(descriptor_for_server(*request.server));
  } else if(request.login) {
    out.owned = open(*request.login);
  } else {
    out.owned = open(descriptor_for_server(settings_->get<std::string>("default_server")));
  }
  out.session = out.owned.get();
  return out;
}
