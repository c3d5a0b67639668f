#include "credentials.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kIvSize = 16;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx make_ctx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if(!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  return ctx;
}

std::string decrypt_blob(const std::string& encoded, const std::string& passphrase) {
  std::vector<unsigned char> raw;
  try {
    raw = base64_decode(encoded);
  } catch(const std::invalid_argument& e) {
    throw ConfigurationError(std::string("credential blob is not base64: ") + e.what());
  }
  if(raw.size() <= kIvSize) {
    throw ConfigurationError("credential blob is too short");
  }
  auto key = sha256_bytes(passphrase);
  auto ctx = make_ctx();
  if(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), raw.data()) != 1) {
    throw ConfigurationError("cannot initialise credential cipher");
  }
  std::vector<unsigned char> plain(raw.size() + EVP_MAX_BLOCK_LENGTH);
  int written = 0;
  int total = 0;
  if(EVP_DecryptUpdate(ctx.get(), plain.data(), &written,
                       raw.data() + kIvSize, static_cast<int>(raw.size() - kIvSize)) != 1) {
    throw ConfigurationError("cannot decrypt credential blob");
  }
  total = written;
  if(EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &written) != 1) {
    throw ConfigurationError("cannot decrypt credential blob (wrong passphrase?)");
  }
  total += written;
  return std::string(reinterpret_cast<const char*>(plain.data()), static_cast<std::size_t>(total));
}

nlohmann::json parse_login(const std::string& text) {
  nlohmann::json login;
  try {
    login = nlohmann::json::parse(text);
  } catch(const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("credential blob is not JSON: ") + e.what());
  }
  if(!login.is_object()) throw ConfigurationError("credential blob must hold a JSON object");
  return login;
}

} // namespace

CredentialDecoder make_credential_decoder(std::string passphrase) {
  return [passphrase = std::move(passphrase)](const nlohmann::json& blob) -> nlohmann::json {
    if(blob.is_object()) return blob;
    if(!blob.is_string()) throw ConfigurationError("credential blob must be a string or an object");
    const auto& text = blob.get_ref<const std::string&>();
    if(passphrase.empty()) return parse_login(text);
    return parse_login(decrypt_blob(text, passphrase));
  };
}

std::string encrypt_credentials(const nlohmann::json& login, const std::string& passphrase) {
  std::string plain = login.dump();
  std::vector<unsigned char> out(kIvSize + plain.size() + EVP_MAX_BLOCK_LENGTH);
  if(RAND_bytes(out.data(), static_cast<int>(kIvSize)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  auto key = sha256_bytes(passphrase);
  auto ctx = make_ctx();
  if(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), out.data()) != 1) {
    throw std::runtime_error("EVP_EncryptInit_ex failed");
  }
  int written = 0;
  int total = 0;
  if(EVP_EncryptUpdate(ctx.get(), out.data() + kIvSize, &written,
                       reinterpret_cast<const unsigned char*>(plain.data()),
                       static_cast<int>(plain.size())) != 1) {
    throw std::runtime_error("EVP_EncryptUpdate failed");
  }
  total = written;
  if(EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvSize + total, &written) != 1) {
    throw std::runtime_error("EVP_EncryptFinal_ex failed");
  }
  total += written;
  out.resize(kIvSize + static_cast<std::size_t>(total));
  return base64_encode(out);
}

ConnectionDescriptor descriptor_from_login(const nlohmann::json& login) {
  if(!login.is_object()) throw ConfigurationError("login must be a JSON object");
  ConnectionDescriptor d;
  try {
    d.host = login.at("host").get<std::string>();
    d.user = login.value("user", std::string("anonymous"));
    d.secret = login.value("passwd", std::string());
    d.use_tls = login.contains("tls") && !login.at("tls").is_null()
      ? login.at("tls").get<bool>()
      : true;
    d.port = login.value("port", static_cast<unsigned short>(21));
  } catch(const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("invalid login: ") + e.what());
  }
  if(d.host.empty()) throw ConfigurationError("login has an empty host");
  for(const auto& item : login.items()) {
    const auto& key = item.key();
    if(key == "host" || key == "user" || key == "passwd" || key == "tls" || key == "port") continue;
    d.options[key] = item.value();
  }
  return d;
}

nlohmann::json login_from_descriptor(const ConnectionDescriptor& descriptor) {
  nlohmann::json login = descriptor.options.is_object() ? descriptor.options : nlohmann::json::object();
  login["host"] = descriptor.host;
  login["port"] = descriptor.port;
  login["user"] = descriptor.user;
  login["passwd"] = descriptor.secret;
  login["tls"] = descriptor.use_tls;
  return login;
}

nlohmann::json seal_login(const nlohmann::json& login, const std::string& passphrase) {
  if(passphrase.empty()) return login;
  return encrypt_credentials(login, passphrase);
}

void add_server(SettingsManager& settings,
                const std::string& name,
                const ConnectionDescriptor& descriptor,
                const std::string& passphrase) {
  if(name.empty()) throw ConfigurationError("server name must not be empty");
  if(descriptor.host.empty()) throw ConfigurationError("server '" + name + "' needs a host");
  auto servers = settings.get<nlohmann::json>("servers");
  if(!servers.is_object()) servers = nlohmann::json::object();
  servers[name] = seal_login(login_from_descriptor(descriptor), passphrase);
  std::string error;
  if(!settings.set_from_json("servers", servers, error)) {
    throw ConfigurationError("cannot store server '" + name + "': " + error);
  }
}
