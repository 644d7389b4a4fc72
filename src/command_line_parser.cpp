#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  SettingsManager lookup(settings_spec_);
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    if(!lookup.resolve_key(out.key)) {
      throw std::runtime_error("argv table references unknown setting '" + out.key + "'");
    }
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, const char* const argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns false when a short token is not a known alias.
    auto handle_option = [&](const std::string& key_token, bool long_form) {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) throw std::invalid_argument("unknown option --" + key_token);
        return false;
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        value = "true";
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        }
      } else {
        if(i + 1 >= args.size()) {
          throw std::invalid_argument("missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw std::invalid_argument("invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }
    if(token.size() > 1 && token[0] == '-') {
      if(handle_option(token.substr(1), false)) continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw std::invalid_argument("unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw std::invalid_argument("invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - LAN peer discovery and file transfer daemon", process_name_);
  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "Usage:\n  {} [options]\n\nOptions:", cmd);
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    const std::string hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases") && !entry.at("aliases").empty()) {
      aliases << " (alias:";
      for(const auto& alias : entry.at("aliases")) {
        aliases << " -" << alias.get<std::string>();
      }
      aliases << ")";
    }
    const auto& def = entry.at("default");
    std::string def_text = def.is_string() ? def.get<std::string>() : def.dump();
    print_out(nullptr, "  --{:<26} {:<13} {}{} (default: {})",
              key, hint, entry.value("description", ""), aliases.str(),
              def_text.empty() ? "\"\"" : def_text);
  }
}
