#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct ConnectionDescriptor {
  std::string host;
  unsigned short port = 21;
  std::string user;
  std::string secret;
  bool use_tls = true;
  nlohmann::json options = nlohmann::json::object(); // extra, connector specific
};

// Receives one block of a retrieved file.
using DataSink = std::function<void(const char* data, std::size_t length)>;
// Fills up to `capacity` bytes, returns 0 at end of input.
using DataSource = std::function<std::size_t(char* buffer, std::size_t capacity)>;

// An authenticated connection to the remote store. Not thread safe: a
// session belongs to exactly one worker or scope at a time.
class Session {
public:
  virtual ~Session() = default;

  virtual std::string current_directory() = 0;
  // Throws RemoteError when the directory cannot be entered.
  virtual void change_directory(const std::string& path) = 0;
  virtual std::vector<std::string> list(const std::string& path) = 0;
  virtual void make_directory(const std::string& path) = 0;
  virtual void set_binary_mode() = 0;
  virtual void retrieve(const std::string& path, const DataSink& sink) = 0;
  virtual void store(const std::string& path, const DataSource& source) = 0;
  virtual void close() = 0;
};

// Opens and logs in a new session. Throws AuthenticationError.
using SessionConnector = std::function<std::unique_ptr<Session>(const ConnectionDescriptor&)>;
