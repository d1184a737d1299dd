#include "engine_config.hpp"

#include <algorithm>

#include "settings_manager.hpp"
#include "utils.hpp"

EngineConfig EngineConfig::from_settings(const SettingsManager& settings,
                                         const std::filesystem::path& workspace_root) {
  EngineConfig config;
  config.concurrent_transfers = static_cast<std::size_t>(settings.get<int>("concurrent_transfers"));
  config.discovery_concurrency = static_cast<std::size_t>(settings.get<int>("discovery_concurrency"));
  config.probe_timeout = std::chrono::milliseconds(settings.get<int>("probe_timeout_ms"));
  config.connect_timeout = std::chrono::milliseconds(settings.get<int>("connect_timeout_ms"));
  config.io_timeout = std::chrono::milliseconds(settings.get<int>("io_timeout_ms"));
  config.ftp_retry_count = static_cast<std::size_t>(settings.get<int>("ftp_retry_count"));
  config.share_expiry = std::chrono::hours(settings.get<int>("share_expiry_hours"));
  config.share_base_url = settings.get<std::string>("share_base_url");
  config.server_port = static_cast<uint16_t>(settings.get<int>("server_port"));
  config.server_bind_address = settings.get<std::string>("server_bind_address");
  config.max_upload_bytes = static_cast<uint64_t>(settings.get<int>("max_upload_mb")) * 1024ull * 1024ull;
  config.history_limit = static_cast<std::size_t>(settings.get<int>("history_limit"));
  config.local_ip_override = settings.get<std::string>("local_ip");

  config.candidate_ports.clear();
  for(int port : settings.get<std::vector<int>>("candidate_ports")) {
    if(port <= 0 || port > 65535) continue;
    auto value = static_cast<uint16_t>(port);
    if(std::find(config.candidate_ports.begin(), config.candidate_ports.end(), value) == config.candidate_ports.end()) {
      config.candidate_ports.push_back(value);
    }
  }

  config.device_id = settings.get<std::string>("device_id");
  if(config.device_id.empty()) {
    config.device_id = "device_" + sha256_hex(host_name()).substr(0, 16);
  }

  auto data_dir = settings.get<std::string>("data_dir");
  config.data_dir = data_dir.empty() ? workspace_root / ".lanshare" : std::filesystem::path(data_dir);
  return config;
}
