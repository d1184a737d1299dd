#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

enum class TransferProtocol { Ftp, Sftp, Http, Https };

const char* to_string(TransferProtocol protocol);
std::optional<TransferProtocol> protocol_from_string(const std::string& value);
uint16_t default_port(TransferProtocol protocol);

struct DiscoveredDevice;

// A saved remote endpoint. The secret is carried in memory only; the
// registry moves it into the SecretStore and to_json() never emits it.
struct ConnectionProfile {
  std::string id;
  std::string name;
  std::string host;
  uint16_t port = 0;
  TransferProtocol protocol = TransferProtocol::Ftp;
  std::string user;
  std::string secret;
  std::map<std::string, std::string> custom_headers;
  std::string remote_path;
  bool is_secure = false;
  bool is_active = false;
  std::optional<std::chrono::system_clock::time_point> last_connected;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};

  uint16_t effective_port() const { return port != 0 ? port : default_port(protocol); }

  // "http://host:port" / "https://host:port"; empty for non-HTTP protocols.
  std::string base_url() const;

  nlohmann::json to_json() const;
  static ConnectionProfile from_json(const nlohmann::json& j);

  // Profile for a scanned device. The id depends only on the device's
  // address and port, so the same device always maps to the same profile.
  static ConnectionProfile from_device(const DiscoveredDevice& device);
  static std::string id_for_device(const DiscoveredDevice& device);
};
