#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"
#include "session_guard.hpp"
#include "session_resolver.hpp"
#include "settings_manager.hpp"
#include "transfer_engine.hpp"
#include "tree_walker.hpp"

// A tree enumeration in progress. Keeps its session open until destroyed.
class TreeWalk {
public:
  TreeWalk(const SessionResolver& resolver,
           const SessionRequest& request,
           std::string root,
           std::optional<std::regex> pattern,
           std::shared_ptr<Logger> logger);

  std::optional<std::string> next() { return walker_.next(); }
  std::vector<std::string> collect() { return walker_.collect(); }

private:
  SessionGuard guard_;
  TreeWalker walker_;
};

// Source path -> destination path.
using FileMap = std::map<std::string, std::string>;

class FtpClient {
public:
  FtpClient(std::shared_ptr<SettingsManager> settings,
            SessionConnector connector,
            CredentialDecoder decoder = {},
            std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::string> ls(const std::string& path, const SessionRequest& request = {});
  bool is_dir(const std::string& path, const SessionRequest& request = {});
  void mkdirs(const std::string& path, const SessionRequest& request = {});

  void download(const std::string& src,
                const std::filesystem::path& dst,
                bool force = false,
                bool makedirs = true,
                const SessionRequest& request = {});
  void upload(const std::filesystem::path& src,
              const std::string& dst,
              bool force = false,
              bool makedirs = true,
              const SessionRequest& request = {});

  std::unique_ptr<TreeWalk> tree(const std::string& src,
                                 const std::optional<std::string>& pattern = std::nullopt,
                                 const SessionRequest& request = {});

  TransferResult download_multiple(const FileMap& files,
                                   bool force = false,
                                   bool makedirs = true,
                                   const SessionRequest& request = {},
                                   const CancellationToken* cancel = nullptr);
  TransferResult upload_multiple(const FileMap& files,
                                 bool force = false,
                                 bool makedirs = false,
                                 const SessionRequest& request = {},
                                 const CancellationToken* cancel = nullptr);

  TransferResult download_tree(const std::string& src,
                               const std::string& dst,
                               bool force = false,
                               const std::optional<std::string>& pattern = std::nullopt,
                               bool makedirs = true,
                               const SessionRequest& request = {},
                               const CancellationToken* cancel = nullptr);
  TransferResult upload_tree(const std::string& src,
                             const std::string& dst,
                             bool force = false,
                             const std::optional<std::string>& pattern = std::nullopt,
                             bool makedirs = true,
                             const SessionRequest& request = {},
                             const CancellationToken* cancel = nullptr);

  TransferEngine& engine() { return engine_; }
  const SessionResolver& resolver() const { return resolver_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  TransferResult run_multiple(const FileMap& files,
                              TransferKind kind,
                              bool force,
                              bool makedirs,
                              const SessionRequest& request,
                              const CancellationToken* cancel);

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  SessionResolver resolver_;
  TransferEngine engine_;
};
