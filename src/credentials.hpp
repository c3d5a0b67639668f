#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "session.hpp"
#include "settings_manager.hpp"

// Turns a stored server entry into the plain login object
// {host, user, passwd, tls?, port?, ...}. Throws ConfigurationError.
using CredentialDecoder = std::function<nlohmann::json(const nlohmann::json& blob)>;

// Object blobs pass through. String blobs are base64(IV || AES-256-CBC
// ciphertext) keyed by SHA-256(passphrase), or plain JSON text when the
// passphrase is empty.
CredentialDecoder make_credential_decoder(std::string passphrase);

std::string encrypt_credentials(const nlohmann::json& login, const std::string& passphrase);

// tls defaults to true; keys other than host/port/user/passwd/tls end up in
// ConnectionDescriptor::options.
ConnectionDescriptor descriptor_from_login(const nlohmann::json& login);

nlohmann::json login_from_descriptor(const ConnectionDescriptor& descriptor);

// Registry entry for `login`: an encrypted string blob, or the login object
// itself when the passphrase is empty.
nlohmann::json seal_login(const nlohmann::json& login, const std::string& passphrase);

// Adds or replaces `name` in the "servers" setting. Throws ConfigurationError.
void add_server(SettingsManager& settings,
                const std::string& name,
                const ConnectionDescriptor& descriptor,
                const std::string& passphrase);
