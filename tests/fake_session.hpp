#pragma once

#include "errors.hpp"
#include "session.hpp"
#include "utils.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bulkftp::test {

// In-memory remote file system shared by every FakeSession of a test.
class FakeRemote {
public:
  // Called before every session operation with the operation name
  // ("cwd", "list", "mkd", "type", "retr", "stor") and the resolved path.
  // Throw from it to inject a fault. Must be set before sessions run.
  using Fault = std::function<void(const std::string& op, const std::string& path)>;
  // Called by the connector before a session is handed out.
  using ConnectFault = std::function<void(const ConnectionDescriptor& login)>;

  void add_dir(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& prefix : remote_prefixes(path)) {
      dirs_.insert(prefix);
    }
  }

  void add_file(const std::string& path, const std::string& content) {
    add_dir(remote_parent(path));
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = content;
  }

  bool has_dir(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirs_.count(path) > 0;
  }

  bool has_file(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(path) > 0;
  }

  std::string file(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    return it == files_.end() ? std::string() : it->second;
  }

  std::size_t file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
  }

  std::vector<ConnectionDescriptor> logins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logins_;
  }

  void record_login(const ConnectionDescriptor& login) {
    std::lock_guard<std::mutex> lock(mutex_);
    logins_.push_back(login);
  }

  Fault fault;
  ConnectFault connect_fault;
  // While positive, each STOR keeps only its first bytes and then drops
  // the connection, like a server left with a partial upload.
  std::atomic<int> truncated_stores{0};

  std::atomic<int> connects{0};
  std::atomic<int> closes{0};
  std::atomic<int> lists{0};
  std::atomic<int> mkds{0};
  std::atomic<int> retrieves{0};
  std::atomic<int> stores{0};
  std::atomic<int> open_sessions{0};
  std::atomic<int> max_open_sessions{0};

private:
  friend class FakeSession;

  mutable std::mutex mutex_;
  std::set<std::string> dirs_{"/"};
  std::map<std::string, std::string> files_;
  std::vector<ConnectionDescriptor> logins_;
};

class FakeSession : public Session {
public:
  explicit FakeSession(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {
    int open = ++remote_->open_sessions;
    int seen = remote_->max_open_sessions.load();
    while(open > seen && !remote_->max_open_sessions.compare_exchange_weak(seen, open)) {}
  }

  ~FakeSession() override {
    if(!closed_) --remote_->open_sessions;
  }

  std::string current_directory() override {
    ensure_open();
    return cwd_;
  }

  void change_directory(const std::string& path) override {
    auto p = resolve(path);
    check("cwd", p);
    if(!remote_->has_dir(p)) throw RemoteError(550, "550 " + p + ": No such directory");
    cwd_ = p;
  }

  std::vector<std::string> list(const std::string& path) override {
    auto p = resolve(path);
    check("list", p);
    ++remote_->lists;
    std::lock_guard<std::mutex> lock(remote_->mutex_);
    if(remote_->files_.count(p)) return {path};
    if(!remote_->dirs_.count(p)) throw RemoteError(550, "550 " + p + ": No such file or directory");
    std::vector<std::string> out;
    const std::string base = path.empty() ? p : path;
    for(const auto& dir : remote_->dirs_) {
      if(dir != "/" && remote_parent(dir) == p) out.push_back(remote_join(base, name_of(dir)));
    }
    for(const auto& entry : remote_->files_) {
      if(remote_parent(entry.first) == p) out.push_back(remote_join(base, name_of(entry.first)));
    }
    return out;
  }

  void make_directory(const std::string& path) override {
    auto p = resolve(path);
    check("mkd", p);
    ++remote_->mkds;
    std::lock_guard<std::mutex> lock(remote_->mutex_);
    if(remote_->dirs_.count(p) || remote_->files_.count(p)) {
      throw RemoteError(550, "550 " + p + ": File exists");
    }
    if(!remote_->dirs_.count(remote_parent(p))) {
      throw RemoteError(550, "550 " + p + ": No such file or directory");
    }
    remote_->dirs_.insert(p);
  }

  void set_binary_mode() override {
    check("type", "");
  }

  void retrieve(const std::string& path, const DataSink& sink) override {
    auto p = resolve(path);
    check("retr", p);
    ++remote_->retrieves;
    std::string content;
    {
      std::lock_guard<std::mutex> lock(remote_->mutex_);
      auto it = remote_->files_.find(p);
      if(it == remote_->files_.end()) throw RemoteError(550, "550 " + p + ": No such file");
      content = it->second;
    }
    if(!content.empty()) sink(content.data(), content.size());
  }

  void store(const std::string& path, const DataSource& source) override {
    auto p = resolve(path);
    check("stor", p);
    std::string content;
    char buffer[7];
    while(std::size_t n = source(buffer, sizeof(buffer))) {
      content.append(buffer, n);
    }
    std::lock_guard<std::mutex> lock(remote_->mutex_);
    if(!remote_->dirs_.count(remote_parent(p))) {
      throw RemoteError(553, "553 " + p + ": Could not create file");
    }
    if(remote_->truncated_stores.fetch_sub(1) > 0) {
      remote_->files_[p] = content.substr(0, 3);
      throw RemoteError(0, "connection lost during STOR " + p);
    }
    remote_->files_[p] = content;
    ++remote_->stores;
  }

  void close() override {
    ++remote_->closes;
    if(closed_) return;
    closed_ = true;
    --remote_->open_sessions;
  }

  bool closed() const { return closed_; }

private:
  static std::string name_of(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
  }

  std::string resolve(const std::string& path) const {
    std::string p = path;
    if(p.empty()) return cwd_;
    if(p[0] != '/') p = remote_join(cwd_, p);
    while(p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
  }

  void ensure_open() const {
    if(closed_) throw RemoteError(0, "session is closed");
  }

  void check(const std::string& op, const std::string& path) const {
    ensure_open();
    if(remote_->fault) remote_->fault(op, path);
  }

  std::shared_ptr<FakeRemote> remote_;
  std::string cwd_ = "/";
  bool closed_ = false;
};

// Connector handing out FakeSessions over `remote`, counting connects.
inline SessionConnector counting_connector(std::shared_ptr<FakeRemote> remote) {
  return [remote](const ConnectionDescriptor& login) -> std::unique_ptr<Session> {
    if(remote->connect_fault) remote->connect_fault(login);
    ++remote->connects;
    remote->record_login(login);
    return std::make_unique<FakeSession>(remote);
  };
}

} // namespace bulkftp::test
