#include "ftp_reply.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

namespace {

bool has_code_prefix(const std::string& line) {
  return line.size() >= 3 &&
         std::isdigit(static_cast<unsigned char>(line[0])) &&
         std::isdigit(static_cast<unsigned char>(line[1])) &&
         std::isdigit(static_cast<unsigned char>(line[2]));
}

} // namespace

bool FtpReplyParser::feed(std::string line) {
  while(!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

  if(!started_) {
    if(!has_code_prefix(line)) {
      throw std::runtime_error("malformed FTP reply: '" + line + "'");
    }
    started_ = true;
    pending_.code = std::stoi(line.substr(0, 3));
    multiline_ = line.size() > 3 && line[3] == '-';
    pending_.text = line.size() > 4 ? line.substr(4) : std::string();
    return !multiline_;
  }

  // a multi-line reply ends with "<same code><space>"
  bool last = has_code_prefix(line) &&
              std::stoi(line.substr(0, 3)) == pending_.code &&
              (line.size() == 3 || line[3] == ' ');
  pending_.text += '\n';
  pending_.text += last ? (line.size() > 4 ? line.substr(4) : std::string()) : line;
  return last;
}

FtpReply FtpReplyParser::take() {
  FtpReply out = std::move(pending_);
  pending_ = FtpReply{};
  multiline_ = false;
  started_ = false;
  return out;
}

std::optional<unsigned short> parse_pasv_port(const std::string& text) {
  static const std::regex pattern(R"((\d+),(\d+),(\d+),(\d+),(\d+),(\d+))");
  std::smatch match;
  if(!std::regex_search(text, match, pattern)) return std::nullopt;
  int high = std::stoi(match[5].str());
  int low = std::stoi(match[6].str());
  if(high > 255 || low > 255) return std::nullopt;
  int port = high * 256 + low;
  if(port == 0) return std::nullopt;
  return static_cast<unsigned short>(port);
}

std::optional<std::string> parse_quoted_path(const std::string& text) {
  auto open = text.find('"');
  if(open == std::string::npos) return std::nullopt;
  std::string path;
  for(std::size_t i = open + 1; i < text.size(); ++i) {
    if(text[i] != '"') {
      path.push_back(text[i]);
      continue;
    }
    if(i + 1 < text.size() && text[i + 1] == '"') {
      path.push_back('"');
      ++i;
      continue;
    }
    return path;
  }
  return std::nullopt;
}
