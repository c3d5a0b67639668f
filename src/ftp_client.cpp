#include "ftp_client.hpp"

#include <system_error>

#include "errors.hpp"
#include "path_operations.hpp"
#include "utils.hpp"

TreeWalk::TreeWalk(const SessionResolver& resolver,
                   const SessionRequest& request,
                   std::string root,
                   std::optional<std::regex> pattern,
                   std::shared_ptr<Logger> logger)
  : guard_(resolver, request, logger),
    walker_(guard_.session(), std::move(root), std::move(pattern), std::move(logger)) {}

FtpClient::FtpClient(std::shared_ptr<SettingsManager> settings,
                     SessionConnector connector,
                     CredentialDecoder decoder,
                     std::shared_ptr<Logger> logger)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("bulkftp")),
    resolver_(settings_, std::move(connector), std::move(decoder), logger_),
    engine_(resolver_, TransferConfig::from_settings(*settings_), logger_) {}

std::vector<std::string> FtpClient::ls(const std::string& path, const SessionRequest& request) {
  SessionGuard guard(resolver_, request, logger_);
  return PathOperations(guard.session(), logger_).list(path);
}

bool FtpClient::is_dir(const std::string& path, const SessionRequest& request) {
  SessionGuard guard(resolver_, request, logger_);
  return PathOperations(guard.session(), logger_).is_directory(path);
}

void FtpClient::mkdirs(const std::string& path, const SessionRequest& request) {
  SessionGuard guard(resolver_, request, logger_);
  PathOperations(guard.session(), logger_).make_directories(path);
}

void FtpClient::download(const std::string& src,
                         const std::filesystem::path& dst,
                         bool force,
                         bool makedirs,
                         const SessionRequest& request) {
  SessionGuard guard(resolver_, request, logger_);
  PathOperations(guard.session(), logger_).download_one(src, dst, force, makedirs);
}

void FtpClient::upload(const std::filesystem::path& src,
                       const std::string& dst,
                       bool force,
                       bool makedirs,
                       const SessionRequest& request) {
  SessionGuard guard(resolver_, request, logger_);
  PathOperations(guard.session(), logger_).upload_one(src, dst, force, makedirs);
}

std::unique_ptr<TreeWalk> FtpClient::tree(const std::string& src,
                                          const std::optional<std::string>& pattern,
                                          const SessionRequest& request) {
  auto compiled = compile_pattern(pattern);
  return std::make_unique<TreeWalk>(resolver_, request, src, std::move(compiled), logger_);
}

TransferResult FtpClient::run_multiple(const FileMap& files,
                                       TransferKind kind,
                                       bool force,
                                       bool makedirs,
                                       const SessionRequest& request,
                                       const CancellationToken* cancel) {
  std::vector<TransferItem> items;
  items.reserve(files.size());
  for(const auto& [src, dst] : files) {
    items.push_back(TransferItem{src, dst, force, makedirs});
  }
  return engine_.run_batch(std::move(items), kind, request, cancel);
}

TransferResult FtpClient::download_multiple(const FileMap& files,
                                            bool force,
                                            bool makedirs,
                                            const SessionRequest& request,
                                            const CancellationToken* cancel) {
  return run_multiple(files, TransferKind::Download, force, makedirs, request, cancel);
}

TransferResult FtpClient::upload_multiple(const FileMap& files,
                                          bool force,
                                          bool makedirs,
                                          const SessionRequest& request,
                                          const CancellationToken* cancel) {
  return run_multiple(files, TransferKind::Upload, force, makedirs, request, cancel);
}

TransferResult FtpClient::download_tree(const std::string& src,
                                        const std::string& dst,
                                        bool force,
                                        const std::optional<std::string>& pattern,
                                        bool makedirs,
                                        const SessionRequest& request,
                                        const CancellationToken* cancel) {
  FileMap files;
  {
    auto walk = tree(src, pattern, request);
    while(auto path = walk->next()) {
      files.emplace(*path, replace_prefix(*path, src, dst));
    }
  }
  log_info(logger_.get(), "Found {} files below {}", files.size(), src);
  return download_multiple(files, force, makedirs, request, cancel);
}

TransferResult FtpClient::upload_tree(const std::string& src,
                                      const std::string& dst,
                                      bool force,
                                      const std::optional<std::string>& pattern,
                                      bool makedirs,
                                      const SessionRequest& request,
                                      const CancellationToken* cancel) {
  auto compiled = compile_pattern(pattern);
  FileMap files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(src, ec), end;
  if(ec) throw LocalIOError("cannot walk " + src + ": " + ec.message());
  for(; it != end; it.increment(ec)) {
    if(!it->is_regular_file()) continue;
    std::string path = it->path().generic_string();
    if(compiled && !std::regex_search(path, *compiled)) continue;
    files.emplace(path, replace_prefix(path, src, dst));
  }
  if(ec) throw LocalIOError("cannot walk " + src + ": " + ec.message());
  log_info(logger_.get(), "Found {} files below {}", files.size(), src);
  return upload_multiple(files, force, makedirs, request, cancel);
}
