#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

class SettingsManager;

// Typed view of the settings table, handed to each component by value.
struct EngineConfig {
  std::size_t concurrent_transfers = 3;
  std::size_t discovery_concurrency = 32;
  std::chrono::milliseconds probe_timeout{500};
  std::vector<uint16_t> candidate_ports{80, 8080, 21, 22, 443, 5000, 8000, 9000};
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds io_timeout{30000};
  std::size_t ftp_retry_count = 3;
  std::chrono::hours share_expiry{24};
  std::string share_base_url;
  uint16_t server_port = 8080;
  std::string server_bind_address = "0.0.0.0";
  uint64_t max_upload_bytes = 1024ull * 1024ull * 1024ull;
  std::size_t history_limit = 100;
  std::string device_id;
  std::string local_ip_override;
  std::filesystem::path data_dir;

  static EngineConfig from_settings(const SettingsManager& settings,
                                    const std::filesystem::path& workspace_root);
};
