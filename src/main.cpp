#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "command_line_parser.hpp"
#include "credentials.hpp"
#include "errors.hpp"
#include "ftp_client.hpp"
#include "ftp_session.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

constexpr int kExitFailures = 2;

SessionRequest request_from_settings(const SettingsManager& settings) {
  auto host = settings.get<std::string>("host");
  if(!host.empty()) {
    int port = settings.get<int>("port");
    if(port <= 0 || port > 65535) {
      throw ConfigurationError("invalid port " + std::to_string(port));
    }
    ConnectionDescriptor login;
    login.host = host;
    login.port = static_cast<unsigned short>(port);
    login.user = settings.get<std::string>("user");
    if(login.user.empty()) login.user = "anonymous";
    login.secret = settings.get<std::string>("password");
    login.use_tls = settings.get<bool>("tls");
    return SessionRequest::with_login(std::move(login));
  }
  auto server = settings.get<std::string>("server");
  if(!server.empty()) return SessionRequest::named(server);
  return {};
}

std::optional<std::string> pattern_from_settings(const SettingsManager& settings) {
  auto pattern = settings.get<std::string>("pattern");
  if(pattern.empty()) return std::nullopt;
  return pattern;
}

int report(Logger& logger, const TransferResult& result) {
  for(const auto& src : result.failed) {
    logger.print("FAILED {}", src);
  }
  for(const auto& src : result.cancelled) {
    logger.print("CANCELLED {}", src);
  }
  return result.ok() ? 0 : kExitFailures;
}

// Cancels `token` on SIGINT/SIGTERM while a batch runs.
class InterruptWatcher {
public:
  explicit InterruptWatcher(CancellationToken& token)
    : signals_(io_, SIGINT, SIGTERM) {
    signals_.async_wait([&token](const std::error_code& ec, int){
      if(!ec) token.cancel();
    });
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~InterruptWatcher() {
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

private:
  asio::io_context io_;
  asio::signal_set signals_;
  std::thread thread_;
};

// Encrypts the explicit login into the registry and writes the settings file.
int add_server_command(Logger& logger, SettingsManager& settings, const std::string& name) {
  auto request = request_from_settings(settings);
  if(!request.login) throw ConfigurationError("add-server needs --host");
  const auto env = settings.get<std::string>("secret_env");
  const char* passphrase = std::getenv(env.c_str());
  if(!passphrase || !*passphrase) {
    logger.warn("{} is not set, storing '{}' unencrypted", env, name);
  }
  add_server(settings, name, *request.login, passphrase ? passphrase : "");
  if(!settings.save()) {
    logger.error("Unable to persist settings to {}", settings.settings_path().string());
    return 1;
  }
  logger.info("Server '{}' saved to {}", name, settings.settings_path().string());
  return 0;
}

int run_command(FtpClient& client,
                const SettingsManager& settings,
                const std::vector<std::string>& args) {
  auto& logger = *client.logger();
  const auto request = request_from_settings(settings);
  const bool force = settings.get<bool>("force");
  const bool makedirs = settings.get<bool>("makedirs");
  const auto& command = args[0];

  if(command == "ls") {
    for(const auto& entry : client.ls(args[1], request)) {
      logger.print("{}", entry);
    }
    return 0;
  }
  if(command == "tree") {
    auto walk = client.tree(args[1], pattern_from_settings(settings), request);
    while(auto path = walk->next()) {
      logger.print("{}", *path);
    }
    return 0;
  }
  if(command == "isdir") {
    logger.print("{}", client.is_dir(args[1], request) ? "true" : "false");
    return 0;
  }
  if(command == "mkdirs") {
    client.mkdirs(args[1], request);
    return 0;
  }
  if(command == "get") {
    client.download(args[1], args[2], force, makedirs, request);
    return 0;
  }
  if(command == "put") {
    client.upload(args[1], args[2], force, makedirs, request);
    return 0;
  }

  CancellationToken cancel;
  InterruptWatcher watcher(cancel);
  if(command == "get-tree") {
    return report(logger, client.download_tree(args[1], args[2], force,
                                               pattern_from_settings(settings),
                                               makedirs, request, &cancel));
  }
  return report(logger, client.upload_tree(args[1], args[2], force,
                                           pattern_from_settings(settings),
                                           makedirs, request, &cancel));
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "bulkftp");

    // first pass only locates the settings file; command line wins over it
    parser.parse(argc, argv, *settings);
    auto config = settings->get<std::string>("config");
    if(!config.empty()) {
      settings->set_settings_path(config);
    }
    settings->load();
    auto args = parser.parse(argc, argv, *settings);

    init(settings->get<bool>("verbose"));
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto logger = std::make_shared<Logger>("bulkftp");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
        return 1;
      }
      logger->info("Settings saved to {}", settings->settings_path().string());
      if(args.empty()) return 0;
    }

    if(args.empty()) {
      parser.usage();
      return 1;
    }
    const auto* command = CommandLineParser::find_command(args[0]);
    if(!command) {
      logger->error("Unknown command '{}'", args[0]);
      parser.usage();
      return 1;
    }
    if(args.size() != command->arguments.size() + 1) {
      logger->error("'{}' expects {} argument(s)", command->name, command->arguments.size());
      parser.usage();
      return 1;
    }

    if(command->name == "add-server") {
      return add_server_command(*logger, *settings, args[1]);
    }

    FtpClient client(settings, FtpSession::connector(logger), {}, logger);
    return run_command(client, *settings, args);
  } catch(const BulkFtpError& e) {
    init(false);
    Logger logger("bulkftp");
    logger.error("{}", e.what());
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("bulkftp");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
