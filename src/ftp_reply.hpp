#pragma once

#include <optional>
#include <string>

struct FtpReply {
  int code = 0;
  std::string text; // all lines, joined with '\n', CRLF stripped

  bool preliminary() const { return code >= 100 && code < 200; }
  bool completed() const { return code >= 200 && code < 300; }
  bool intermediate() const { return code >= 300 && code < 400; }
  bool failed() const { return code >= 400; }
};

// Accumulates control-channel lines until a full (possibly multi-line)
// reply has been seen.
class FtpReplyParser {
public:
  // Returns true once the reply is complete. Throws std::runtime_error on
  // a first line that does not start with a three digit code.
  bool feed(std::string line);
  FtpReply take();

private:
  FtpReply pending_;
  bool multiline_ = false;
  bool started_ = false;
};

// "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)" -> p1 * 256 + p2
std::optional<unsigned short> parse_pasv_port(const std::string& text);

// 257 "<path>" created/is current; doubled quotes inside the path unescape.
std::optional<std::string> parse_quoted_path(const std::string& text);
