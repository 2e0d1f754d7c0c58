#pragma once

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source"},              {"aliases", {"server","from"}},  {"type","string"}, {"default",""},         {"description","Server host:port or directory to sync mods from"}, {"persistent", true}},
  {{"key","install_dir"},         {"aliases", {"install","i"}},    {"type","string"}, {"default",""},         {"description","Game install directory (empty = platform default)"}, {"persistent", true}},
  {{"key","keep_existing"},       {"aliases", {"keep","k"}},       {"type","bool"},   {"default",false},      {"description","Keep local mods that are not on the server"}, {"persistent", true}},
  {{"key","force"},               {"aliases", {"f"}},              {"type","bool"},   {"default",false},      {"description","Overwrite local mods without comparing sizes"}, {"persistent", false}},
  {{"key","artifact_extension"},  {"aliases", {"ext"}},            {"type","string"}, {"default",".jar"},     {"description","File suffix of recognized mods"}, {"persistent", true}},
  {{"key","serve"},               {"aliases", {"s"}},              {"type","bool"},   {"default",false},      {"description","Serve a mods directory instead of syncing"}, {"persistent", false}},
  {{"key","serve_dir"},           {"aliases", {"sd"}},             {"type","string"}, {"default",""},         {"description","Directory to serve (empty = local mods directory)"}, {"persistent", true}},
  {{"key","listen_ip"},           {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"},  {"description","Interface/IP to bind when serving"}, {"persistent", true}},
  {{"key","listen_port"},         {"aliases", {"lp"}},             {"type","int"},    {"default",25585},      {"min",0}, {"max",65535}, {"description","TCP port to listen on when serving (0 = any free port)"}, {"persistent", true}},
  {{"key","transfer_progress"},   {"aliases", {"progress","tp"}},  {"type","bool"},   {"default",true},       {"description","Show ASCII progress meter per phase"}, {"persistent", true}},
  {{"key","progress_meter_size"}, {"aliases", {"meter","pms"}},    {"type","int"},    {"default",40},         {"min",1}, {"max",500}, {"description","Number of characters used for the progress meter"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"log"}},            {"type","string"}, {"default",""},         {"description","Also append log output to this file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<int> min_value;
    std::optional<int> max_value;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min_value = entry.at("min").get<int>();
    if(entry.contains("max")) spec.max_value = entry.at("max").get<int>();
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                                  const nlohmann::json& value,
                                                  std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    const int number = value.get<int>();
    if((spec.min_value && number < *spec.min_value) || (spec.max_value && number > *spec.max_value)) {
      error = "out of range [" + std::to_string(spec.min_value.value_or(INT_MIN)) + ", " +
              std::to_string(spec.max_value.value_or(INT_MAX)) + "]";
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                                const std::string& value,
                                                std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
