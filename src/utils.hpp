#pragma once
#include <string>
#include <vector>

std::vector<unsigned char> sha256_bytes(const std::string &data);

// Throws std::invalid_argument on malformed input.
std::vector<unsigned char> base64_decode(const std::string &encoded);
std::string base64_encode(const std::vector<unsigned char> &raw);

// Remote paths always use '/'.
std::string remote_parent(const std::string &path);
std::string remote_join(const std::string &dir, const std::string &name);
std::vector<std::string> remote_prefixes(const std::string &path);

// Replaces a leading `from` with `to`; returns `path` unchanged otherwise.
std::string replace_prefix(const std::string &path, const std::string &from, const std::string &to);
