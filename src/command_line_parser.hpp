#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps `--key value`, `-alias value` and positional arguments onto settings.
// Bool options accept an optional literal: `--verbose` or `--verbose off`.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "lansyncd",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","data_dir"}},
                      {{"index",1},{"key","device_name"}}
                    }));

  // Throws std::invalid_argument describing the first bad token.
  void parse(int argc, const char* const argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
