#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "log.hpp"
#include "path_operations.hpp"
#include "session.hpp"

// Throws ConfigurationError for an invalid expression.
std::optional<std::regex> compile_pattern(const std::optional<std::string>& pattern);

// Depth-first, single pass enumeration of the files below a remote root.
// Directories are listed only when the walk reaches them.
class TreeWalker {
public:
  TreeWalker(Session& session,
             std::string root,
             std::optional<std::regex> pattern = std::nullopt,
             std::shared_ptr<Logger> logger = nullptr);

  // Next matching file, or nullopt once the tree is exhausted.
  std::optional<std::string> next();

  std::vector<std::string> collect();

private:
  struct Frame {
    std::vector<std::string> children;
    std::size_t index = 0;
  };

  bool matches(const std::string& path) const;

  PathOperations ops_;
  std::string root_;
  std::optional<std::regex> pattern_;
  std::vector<Frame> stack_;
  bool started_ = false;
};
