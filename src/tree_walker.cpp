#include "tree_walker.hpp"

#include "errors.hpp"

namespace {

bool is_dot_entry(const std::string& path) {
  auto pos = path.rfind('/');
  std::string name = pos == std::string::npos ? path : path.substr(pos + 1);
  return name == "." || name == "..";
}

} // namespace

std::optional<std::regex> compile_pattern(const std::optional<std::string>& pattern) {
  if(!pattern || pattern->empty()) return std::nullopt;
  try {
    return std::regex(*pattern);
  } catch(const std::regex_error& e) {
    throw ConfigurationError("invalid pattern '" + *pattern + "': " + e.what());
  }
}

TreeWalker::TreeWalker(Session& session,
                       std::string root,
                       std::optional<std::regex> pattern,
                       std::shared_ptr<Logger> logger)
  : ops_(session, std::move(logger)),
    root_(std::move(root)),
    pattern_(std::move(pattern)) {}

bool TreeWalker::matches(const std::string& path) const {
  return !pattern_ || std::regex_search(path, *pattern_);
}

std::optional<std::string> TreeWalker::next() {
  if(!started_) {
    started_ = true;
    stack_.push_back(Frame{ops_.list(root_), 0});
  }
  while(!stack_.empty()) {
    auto& top = stack_.back();
    if(top.index >= top.children.size()) {
      stack_.pop_back();
      continue;
    }
    std::string path = top.children[top.index++];
    if(is_dot_entry(path)) continue;
    if(ops_.is_directory(path)) {
      auto children = ops_.list(path);
      stack_.push_back(Frame{std::move(children), 0});
      continue;
    }
    if(matches(path)) return path;
  }
  return std::nullopt;
}

std::vector<std::string> TreeWalker::collect() {
  std::vector<std::string> out;
  while(auto path = next()) {
    out.push_back(std::move(*path));
  }
  return out;
}
