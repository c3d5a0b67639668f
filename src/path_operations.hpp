#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "session.hpp"

// Single-item operations against one session. Errors propagate to the
// caller unchanged; nothing here retries.
class PathOperations {
public:
  explicit PathOperations(Session& session, std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::string> list(const std::string& path);

  // Listing based existence check; "no such file" replies (450/550) mean
  // false, any other refusal propagates.
  bool exists(const std::string& path);

  // Tests with a change-directory and always puts the cursor back.
  bool is_directory(const std::string& path);

  // Creates every missing ancestor of `path` and `path` itself, root first.
  void make_directories(const std::string& path);

  void download_one(const std::string& src,
                    const std::filesystem::path& dst,
                    bool overwrite,
                    bool create_dirs);

  // Sets `*creating` once STOR starts on a destination that did not exist,
  // so a caller retrying a broken upload knows the leftover is its own.
  void upload_one(const std::filesystem::path& src,
                  const std::string& dst,
                  bool overwrite,
                  bool create_dirs,
                  bool* creating = nullptr);

private:
  Session& session_;
  std::shared_ptr<Logger> logger_;
};
