#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

struct CommandSpec {
  std::string name;
  std::vector<std::string> arguments;
  std::string description;
};

class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "bulkftp",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Options land in `settings`; everything else is returned in order
  // (the command word first).
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

  static const std::vector<CommandSpec>& commands();
  static const CommandSpec* find_command(const std::string& name);

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
