#include "command_line_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

const std::vector<CommandSpec>& CommandLineParser::commands() {
  static const std::vector<CommandSpec> table = {
    {"ls",       {"path"},       "List the entries of a remote directory"},
    {"tree",     {"path"},       "List every remote file below a directory (honours --pattern)"},
    {"isdir",    {"path"},       "Print whether a remote path is a directory"},
    {"mkdirs",   {"path"},       "Create a remote directory and its missing parents"},
    {"get",      {"src", "dst"}, "Download one file"},
    {"put",      {"src", "dst"}, "Upload one file"},
    {"get-tree", {"src", "dst"}, "Download a remote tree in parallel"},
    {"put-tree", {"src", "dst"}, "Upload a local tree in parallel"},
    {"add-server", {"name"},     "Store --host/--user/--password/--port/--tls as a named server"},
  };
  return table;
}

const CommandSpec* CommandLineParser::find_command(const std::string& name) {
  for(const auto& command : commands()) {
    if(command.name == name) return &command;
  }
  return nullptr;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> positional;

  auto fail = [&](const std::string& message){
    print_err(nullptr, "{}", message);
    usage();
    std::exit(1);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          fail("Unknown option --" + key_token);
        }
        return false; // treat as positional for short tokens
      }
      bool is_bool = settings.is_bool_setting(*resolved);
      std::string value;
      if(is_bool) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          fail("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token == "--") {
      positional.insert(positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
      break;
    }

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
      // fall through to positional if alias unrecognised
    }

    positional.push_back(token);
  }
  return positional;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - parallel FTP transfers", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options] <command> [arguments]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& command : commands()) {
    std::string synopsis = command.name;
    for(const auto& argument : command.arguments) {
      synopsis += " <" + argument + ">";
    }
    print_out(nullptr, "  {:<22} {}", synopsis, command.description);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
