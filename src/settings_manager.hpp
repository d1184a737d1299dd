#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every tunable of the sharing engine. "min"/"max" bound int settings,
// "int_list" settings hold a JSON array of integers ("80,8080" on the CLI).
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_port"},           {"aliases", {"port","p"}},       {"type","int"},      {"default",8080},        {"min",0}, {"max",65535}, {"description","Port the local sharing server binds"}, {"persistent", true}},
  {{"key","server_bind_address"},   {"aliases", {"bind"}},           {"type","string"},   {"default","0.0.0.0"},   {"description","Interface the local sharing server binds"}, {"persistent", true}},
  {{"key","local_ip"},              {"aliases", {"ip"}},             {"type","string"},   {"default",""},          {"description","Override the detected local IPv4 address"}, {"persistent", true}},
  {{"key","concurrent_transfers"},  {"aliases", {"ct"}},             {"type","int"},      {"default",3},           {"min",1}, {"max",64}, {"description","Maximum transfers executing at once"}, {"persistent", true}},
  {{"key","discovery_concurrency"}, {"aliases", {"dc"}},             {"type","int"},      {"default",32},          {"min",1}, {"max",1024}, {"description","Maximum simultaneous discovery probe sockets"}, {"persistent", true}},
  {{"key","probe_timeout_ms"},      {"aliases", {"pt"}},             {"type","int"},      {"default",500},         {"min",10}, {"max",60000}, {"description","Discovery probe connect timeout"}, {"persistent", true}},
  {{"key","candidate_ports"},       {"aliases", {"ports"}},          {"type","int_list"}, {"default",{80,8080,21,22,443,5000,8000,9000}}, {"description","Ports probed on every discovery host"}, {"persistent", true}},
  {{"key","connect_timeout_ms"},    {"aliases", {"cto"}},            {"type","int"},      {"default",5000},        {"min",10}, {"max",600000}, {"description","Connect timeout for transfer and probe sessions"}, {"persistent", true}},
  {{"key","io_timeout_ms"},         {"aliases", {"ito"}},            {"type","int"},      {"default",30000},       {"min",10}, {"max",3600000}, {"description","Inactivity timeout for a single read or write"}, {"persistent", true}},
  {{"key","ftp_retry_count"},       {"aliases", {"retries"}},        {"type","int"},      {"default",3},           {"min",1}, {"max",20}, {"description","FTP attempts before a transfer fails"}, {"persistent", true}},
  {{"key","share_expiry_hours"},    {"aliases", {"expiry"}},         {"type","int"},      {"default",24},          {"min",1}, {"max",8760}, {"description","Lifetime of share links"}, {"persistent", true}},
  {{"key","share_base_url"},        {"aliases", {"share_url"}},      {"type","string"},   {"default",""},          {"description","Base URL of share links (empty: https://<local ip>)"}, {"persistent", true}},
  {{"key","max_upload_mb"},         {"aliases", {"upload_limit"}},   {"type","int"},      {"default",1024},        {"min",1}, {"max",1048576}, {"description","Largest upload body the server accepts"}, {"persistent", true}},
  {{"key","history_limit"},         {"aliases", {"history"}},        {"type","int"},      {"default",100},         {"min",0}, {"max",100000}, {"description","Finished transfers kept in history"}, {"persistent", true}},
  {{"key","device_id"},             {"aliases", {"id"}},             {"type","string"},   {"default",""},          {"description","Device identifier stamped on shares (empty: derived from host name)"}, {"persistent", true}},
  {{"key","data_dir"},              {"aliases", {"data"}},           {"type","string"},   {"default",""},          {"description","Directory for persisted shares, connections and secrets"}, {"persistent", true}},
  {{"key","log_file"},              {"aliases", {"log"}},            {"type","string"},   {"default",""},          {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},               {"aliases", {"v"}},              {"type","bool"},     {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},          {"type","bool"},     {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},        {"type","bool"},     {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
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
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  bool check_range(const SettingSpec& spec, long long value, std::string& error) const;
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

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
