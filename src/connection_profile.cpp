#include "connection_profile.hpp"

#include <stdexcept>

#include "discovery.hpp"
#include "utils.hpp"

const char* to_string(TransferProtocol protocol) {
  switch(protocol) {
    case TransferProtocol::Ftp: return "ftp";
    case TransferProtocol::Sftp: return "sftp";
    case TransferProtocol::Http: return "http";
    case TransferProtocol::Https: return "https";
  }
  return "ftp";
}

std::optional<TransferProtocol> protocol_from_string(const std::string& value) {
  auto lowered = to_lower(value);
  if(lowered == "ftp") return TransferProtocol::Ftp;
  if(lowered == "sftp") return TransferProtocol::Sftp;
  if(lowered == "http") return TransferProtocol::Http;
  if(lowered == "https") return TransferProtocol::Https;
  return std::nullopt;
}

uint16_t default_port(TransferProtocol protocol) {
  switch(protocol) {
    case TransferProtocol::Ftp: return 21;
    case TransferProtocol::Sftp: return 22;
    case TransferProtocol::Http: return 80;
    case TransferProtocol::Https: return 443;
  }
  return 0;
}

std::string ConnectionProfile::base_url() const {
  if(protocol != TransferProtocol::Http && protocol != TransferProtocol::Https) return std::string();
  bool tls = protocol == TransferProtocol::Https || is_secure;
  return std::string(tls ? "https" : "http") + "://" + host + ":" + std::to_string(effective_port());
}

nlohmann::json ConnectionProfile::to_json() const {
  nlohmann::json j{
    {"id", id},
    {"name", name},
    {"host", host},
    {"port", port},
    {"protocol", ::to_string(protocol)},
    {"user", user},
    {"customHeaders", custom_headers},
    {"remotePath", remote_path},
    {"isSecure", is_secure},
    {"isActive", is_active},
    {"createdAt", to_epoch_ms(created_at)},
    {"updatedAt", to_epoch_ms(updated_at)},
  };
  j["lastConnected"] = last_connected ? nlohmann::json(to_epoch_ms(*last_connected)) : nlohmann::json(nullptr);
  return j;
}

ConnectionProfile ConnectionProfile::from_json(const nlohmann::json& j) {
  ConnectionProfile p;
  p.id = j.at("id").get<std::string>();
  p.name = j.value("name", std::string());
  p.host = j.at("host").get<std::string>();
  p.port = j.value("port", static_cast<uint16_t>(0));
  auto protocol = protocol_from_string(j.value("protocol", std::string("ftp")));
  if(!protocol) {
    throw std::invalid_argument("unknown protocol '" + j.value("protocol", std::string()) + "'");
  }
  p.protocol = *protocol;
  p.user = j.value("user", std::string());
  if(j.contains("customHeaders") && j.at("customHeaders").is_object()) {
    p.custom_headers = j.at("customHeaders").get<std::map<std::string, std::string>>();
  }
  p.remote_path = j.value("remotePath", std::string());
  p.is_secure = j.value("isSecure", false);
  p.is_active = j.value("isActive", false);
  if(j.contains("lastConnected") && j.at("lastConnected").is_number_integer()) {
    p.last_connected = from_epoch_ms(j.at("lastConnected").get<int64_t>());
  }
  p.created_at = from_epoch_ms(j.value("createdAt", int64_t{0}));
  p.updated_at = from_epoch_ms(j.value("updatedAt", int64_t{0}));
  return p;
}

std::string ConnectionProfile::id_for_device(const DiscoveredDevice& device) {
  std::string address = device.ip_address;
  for(auto& ch : address) {
    if(ch == ':') ch = '-';
  }
  return "device-" + address + "-" + std::to_string(device.port);
}

ConnectionProfile ConnectionProfile::from_device(const DiscoveredDevice& device) {
  ConnectionProfile p;
  p.id = id_for_device(device);
  p.name = device.name.empty() ? device.ip_address : device.name;
  p.host = device.ip_address;
  p.port = device.port;
  switch(device.service) {
    case ServiceKind::Ftp: p.protocol = TransferProtocol::Ftp; break;
    case ServiceKind::Ssh: p.protocol = TransferProtocol::Sftp; break;
    case ServiceKind::Https: p.protocol = TransferProtocol::Https; break;
    default: p.protocol = TransferProtocol::Http; break;
  }
  p.is_secure = p.protocol == TransferProtocol::Https;
  return p;
}
