#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","connections"},      {"aliases", {"c","workers"}},     {"type","int"},    {"default",5},       {"description","Parallel sessions used by batch transfers"}, {"persistent", true}},
  {{"key","retries"},          {"aliases", {"r"}},               {"type","int"},    {"default",5},       {"description","Attempts per item before it is reported as failed"}, {"persistent", true}},
  {{"key","backoff_floor_ms"}, {"aliases", {"bf"}},              {"type","int"},    {"default",200},     {"description","Minimum wait between two attempts"}, {"persistent", true}},
  {{"key","backoff_unit_ms"},  {"aliases", {"bu"}},              {"type","int"},    {"default",500},     {"description","Exponential backoff step"}, {"persistent", true}},
  {{"key","backoff_cap_ms"},   {"aliases", {"bc"}},              {"type","int"},    {"default",60000},   {"description","Upper bound of a single backoff wait"}, {"persistent", true}},
  {{"key","default_server"},   {"aliases", {"ds"}},              {"type","string"}, {"default","main"},  {"description","Server used when no session, server or login is given"}, {"persistent", true}},
  {{"key","servers"},          {"aliases", nlohmann::json::array()}, {"type","json"}, {"default",nlohmann::json::object()}, {"description","Server name -> stored credential blob"}, {"persistent", true}},
  {{"key","secret_env"},       {"aliases", nlohmann::json::array()}, {"type","string"}, {"default","BULKFTP_SECRET"}, {"description","Environment variable holding the credential passphrase"}, {"persistent", true}},
  {{"key","verbose"},          {"aliases", {"v"}},               {"type","bool"},   {"default",false},   {"description","Enable debug logging"}, {"persistent", true}},
  {{"key","server"},           {"aliases", {"s"}},               {"type","string"}, {"default",""},      {"description","Named server from the registry"}, {"persistent", false}},
  {{"key","host"},             {"aliases", nlohmann::json::array()},{"type","string"}, {"default",""},      {"description","Explicit host (skips the registry)"}, {"persistent", false}},
  {{"key","port"},             {"aliases", nlohmann::json::array()},{"type","int"},    {"default",21},      {"description","Explicit port"}, {"persistent", false}},
  {{"key","user"},             {"aliases", {"u"}},               {"type","string"}, {"default",""},      {"description","Explicit user name"}, {"persistent", false}},
  {{"key","password"},         {"aliases", {"pw"}},              {"type","string"}, {"default",""},      {"description","Explicit password"}, {"persistent", false}},
  {{"key","tls"},              {"aliases", nlohmann::json::array()}, {"type","bool"}, {"default",true},  {"description","Use explicit TLS for an explicit login"}, {"persistent", false}},
  {{"key","force"},            {"aliases", {"f"}},               {"type","bool"},   {"default",false},   {"description","Overwrite existing destinations"}, {"persistent", false}},
  {{"key","makedirs"},         {"aliases", {"m"}},               {"type","bool"},   {"default",true},    {"description","Create missing destination directories"}, {"persistent", false}},
  {{"key","pattern"},          {"aliases", {"p"}},               {"type","string"}, {"default",""},      {"description","Regular expression filtering tree walks"}, {"persistent", false}},
  {{"key","config"},           {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""},  {"description","Settings file to load instead of the default"}, {"persistent", false}},
  {{"key","help"},             {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},   {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},             {"aliases", {"persist"}},         {"type","bool"},   {"default",false},   {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
