#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    result.push_back(ArgvSpec{entry.at("index").get<std::size_t>(),
                              entry.at("key").get<std::string>()});
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const char* const kLiterals[] = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return std::any_of(std::begin(kLiterals), std::end(kLiterals),
                     [&](const char* literal){ return lowered == literal; });
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  try {
    apply(argc, argv, settings);
  } catch(const std::invalid_argument& e) {
    print_err(nullptr, "{}", e.what());
    usage();
    std::exit(1);
  }
}

void CommandLineParser::apply(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }

  auto store = [&](const std::string& key, const std::string& value, const std::string& label){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw std::invalid_argument("Invalid value for " + label + " '" + value + "': " + error);
    }
  };

  std::size_t positional_index = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    const bool long_form = token.rfind("--", 0) == 0;
    const bool short_form = !long_form && token.size() > 1 && token[0] == '-';

    if(long_form || short_form) {
      const std::string key_token = token.substr(long_form ? 2 : 1);
      auto resolved = settings.resolve_key(key_token);
      if(!resolved && long_form) {
        throw std::invalid_argument("Unknown option --" + key_token);
      }
      if(resolved) {
        std::string value;
        if(settings.is_bool_setting(*resolved)) {
          // bare flag means true; an explicit literal may follow
          const bool literal_follows = i + 1 < args.size() &&
            !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1]);
          value = literal_follows ? args[++i] : "true";
        } else {
          if(i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for option '" + key_token + "'");
          }
          value = args[++i];
        }
        store(*resolved, value, "option '" + key_token + "'");
        continue;
      }
      // unknown short alias: fall through as a positional value
    }

    if(positional_index >= positional_specs_.size()) {
      throw std::invalid_argument("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    store(spec.key, token, spec.key);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - sync local mods with a server", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "  {} --serve [--serve_dir <dir>] [--listen_port <port>]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        aliases << (i == 0 ? " (alias: " : ", ") << "-" << alias_list[i];
      }
      if(!alias_list.empty()) aliases << ")";
    }
    const auto& default_value = entry.at("default");
    std::string default_str;
    if(default_value.is_boolean()) {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str.empty() ? "\"\"" : default_str);
  }
  print_out(nullptr, "");
}
