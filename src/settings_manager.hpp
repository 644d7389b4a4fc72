#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Declarative table of every daemon setting. "min"/"max" bound integer
// settings; values outside the range are rejected on load and on set.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","device_id"},               {"aliases", {"id"}},            {"type","string"}, {"default",""},                {"description","Stable device identifier (generated on first run)"}, {"persistent", true}},
  {{"key","device_name"},             {"aliases", {"name","dn"}},     {"type","string"}, {"default",""},                {"description","Display name announced to peers (hostname when empty)"}, {"persistent", true}},
  {{"key","data_dir"},                {"aliases", {"dd"}},            {"type","string"}, {"default",""},                {"description","Directory for the database, certificate and settings"}, {"persistent", false}},
  {{"key","inbox_dir"},               {"aliases", {"inbox"}},         {"type","string"}, {"default",""},                {"description","Directory receiving incoming files (<data_dir>/inbox when empty)"}, {"persistent", true}},
  {{"key","listen_ip"},               {"aliases", {"li"}},            {"type","string"}, {"default","0.0.0.0"},         {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","discovery_port"},          {"aliases", {"dp"}},            {"type","int"},    {"default",37845},             {"description","UDP port for presence beacons"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","broadcast_address"},       {"aliases", {"ba"}},            {"type","string"}, {"default","255.255.255.255"}, {"description","Destination address for presence beacons"}, {"persistent", true}},
  {{"key","broadcast_port"},          {"aliases", {"bp"}},            {"type","int"},    {"default",37845},             {"description","UDP port presence beacons are sent to"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","transfer_port"},           {"aliases", {"tp"}},            {"type","int"},    {"default",37846},             {"description","TCP port accepting incoming transfers"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","peer_transfer_port"},      {"aliases", {"ptp"}},           {"type","int"},    {"default",37846},             {"description","TCP port dialed on peers"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","broadcast_interval_ms"},   {"aliases", {"bim"}},           {"type","int"},    {"default",5000},              {"description","Milliseconds between presence beacons"}, {"persistent", true}, {"min",50}, {"max",600000}},
  {{"key","presence_timeout_ms"},     {"aliases", {"ptm"}},           {"type","int"},    {"default",15000},             {"description","Peers silent for longer are removed"}, {"persistent", true}, {"min",100}, {"max",3600000}},
  {{"key","replay_window_ms"},        {"aliases", {"rwm"}},           {"type","int"},    {"default",30000},             {"description","Maximum accepted beacon clock skew"}, {"persistent", true}, {"min",100}, {"max",3600000}},
  {{"key","reaper_interval_ms"},      {"aliases", {"rim"}},           {"type","int"},    {"default",1000},              {"description","Milliseconds between stale peer sweeps"}, {"persistent", true}, {"min",10}, {"max",600000}},
  {{"key","chunk_size"},              {"aliases", {"cs"}},            {"type","int"},    {"default",1048576},           {"description","Bytes per transfer chunk"}, {"persistent", true}, {"min",1024}, {"max",8388608}},
  {{"key","window_size"},             {"aliases", {"ws"}},            {"type","int"},    {"default",4},                 {"description","Unacknowledged chunks in flight per session"}, {"persistent", true}, {"min",1}, {"max",64}},
  {{"key","max_chunk_retries"},       {"aliases", {"mcr"}},           {"type","int"},    {"default",3},                 {"description","Retransmissions allowed per chunk"}, {"persistent", true}, {"min",0}, {"max",100}},
  {{"key","max_concurrent_transfers"},{"aliases", {"mct"}},           {"type","int"},    {"default",4},                 {"description","Outbound sessions running at once"}, {"persistent", true}, {"min",1}, {"max",256}},
  {{"key","handshake_timeout_ms"},    {"aliases", {"htm"}},           {"type","int"},    {"default",10000},             {"description","Connect + TLS + resume negotiation deadline"}, {"persistent", true}, {"min",100}, {"max",600000}},
  {{"key","ack_timeout_ms"},          {"aliases", {"atm"}},           {"type","int"},    {"default",15000},             {"description","Deadline for the next acknowledgment"}, {"persistent", true}, {"min",100}, {"max",600000}},
  {{"key","auto_resume_attempts"},    {"aliases", {"ara"}},           {"type","int"},    {"default",3},                 {"description","Automatic resumes after a network pause"}, {"persistent", true}, {"min",0}, {"max",20}},
  {{"key","worker_threads"},          {"aliases", {"wt"}},            {"type","int"},    {"default",4},                 {"description","Threads running the network loop"}, {"persistent", true}, {"min",1}, {"max",64}},
  {{"key","shared_secret"},           {"aliases", {"secret"}},        {"type","string"}, {"default",""},                {"description","Discovery secret (set by pairing)"}, {"persistent", true}},
  {{"key","verbose"},                 {"aliases", {"v"}},             {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},                {"aliases", {"lf"}},            {"type","string"}, {"default",""},                {"description","Append log lines to this file"}, {"persistent", true}},
  {{"key","help"},                    {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},       {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
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

  // <data_dir>/.config/settings.json unless overridden.
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
    std::optional<int64_t> min_value;
    std::optional<int64_t> max_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
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
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min_value = entry.at("min").get<int64_t>();
    if(entry.contains("max")) spec.max_value = entry.at("max").get<int64_t>();
    spec.persistent = entry.value("persistent", true);
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
  const std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  std::filesystem::path root = get<std::string>("data_dir");
  if(root.empty()) root = std::filesystem::current_path();
  return root / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  try {
    merge_from_json(nlohmann::json::parse(in));
    return true;
  } catch(const nlohmann::json::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      log_error(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      log_warn(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      log_warn(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(!value.is_boolean()) {
      error = "expected boolean";
      return false;
    }
    settings_[spec.key] = value.get<bool>();
    return true;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    const auto v = value.get<int64_t>();
    if((spec.min_value && v < *spec.min_value) || (spec.max_value && v > *spec.max_value)) {
      error = "out of range [" + std::to_string(spec.min_value.value_or(INT64_MIN)) + ", " +
              std::to_string(spec.max_value.value_or(INT64_MAX)) + "]";
      return false;
    }
    settings_[spec.key] = v;
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    settings_[spec.key] = value.get<std::string>();
    return true;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    const std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      const long long parsed = std::stoll(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters in '" + clean + "'";
        return {};
      }
      return static_cast<int64_t>(parsed);
    } catch(const std::exception& e) {
      error = std::string("not an integer: ") + e.what();
      return {};
    }
  }
  return clean;
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

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  const std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
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
