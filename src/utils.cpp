#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::vector<unsigned char> base64_decode(const std::string &encoded){
    std::string clean;
    clean.reserve(encoded.size());
    for(char c : encoded){
        if(c != '\n' && c != '\r' && c != ' ' && c != '\t') clean.push_back(c);
    }
    if(clean.empty()) return {};
    if(clean.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), (const unsigned char*)clean.data(), (int)clean.size());
    if(n < 0) throw std::invalid_argument("invalid base64 input");
    // EVP_DecodeBlock keeps the padding bytes as zeros
    std::size_t padding = 0;
    if(clean[clean.size() - 1] == '=') ++padding;
    if(clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::string base64_encode(const std::vector<unsigned char> &raw){
    if(raw.empty()) return "";
    std::string out(4 * ((raw.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock((unsigned char*)out.data(), raw.data(), (int)raw.size());
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string remote_parent(const std::string &path){
    auto pos = path.rfind('/');
    if(pos == std::string::npos) return "";
    if(pos == 0) return "/";
    return path.substr(0, pos);
}

std::string remote_join(const std::string &dir, const std::string &name){
    if(dir.empty()) return name;
    if(dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::vector<std::string> remote_prefixes(const std::string &path){
    std::vector<std::string> out;
    const bool absolute = !path.empty() && path[0] == '/';
    std::string current;
    std::size_t start = 0;
    while(start <= path.size()){
        auto end = path.find('/', start);
        if(end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);
        start = end + 1;
        if(segment.empty()) continue;
        if(current.empty()) current = absolute ? "/" + segment : segment;
        else current += "/" + segment;
        out.push_back(current);
    }
    return out;
}

std::string replace_prefix(const std::string &path, const std::string &from, const std::string &to){
    if(from.empty() || path.compare(0, from.size(), from) != 0) return path;
    return to + path.substr(from.size());
}
