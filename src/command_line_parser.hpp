#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "modsync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","source"}},
                      {{"index",1},{"key","install_dir"}}
                    }));

  // Applies argv on top of whatever settings already holds. Invalid input
  // prints usage and exits the process with status 1.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  // Same as parse() but throws std::invalid_argument instead of exiting.
  void apply(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
