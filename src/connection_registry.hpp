#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "connection_profile.hpp"
#include "engine_config.hpp"
#include "errors.hpp"

class FtpClient;
struct DiscoveredDevice;
class HttpClient;
class KeyValueStore;
class Logger;
class SecretStore;

struct ProbeResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
};

// Liveness check run before a profile is accepted.
class EndpointProber {
public:
  using Completion = std::function<void(const ProbeResult&)>;

  virtual ~EndpointProber() = default;
  virtual void probe(const ConnectionProfile& profile, Completion done) = 0;
};

// FTP: log in and QUIT. HTTP/HTTPS: HEAD / expecting 2xx. SFTP: assumed reachable.
class NetworkProber : public EndpointProber {
public:
  NetworkProber(asio::io_context& io, const EngineConfig& config, std::shared_ptr<Logger> logger = nullptr);
  ~NetworkProber() override;

  void probe(const ConnectionProfile& profile, Completion done) override;

  HttpClient& http() { return *http_; }

private:
  asio::io_context& io_;
  std::unique_ptr<FtpClient> ftp_;
  std::unique_ptr<HttpClient> http_;
};

struct AddConnectionResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  ConnectionProfile profile;
};

class ConnectionRegistry {
public:
  using AddCallback = std::function<void(const AddConnectionResult&)>;
  using RemovalHook = std::function<void(const std::string& connection_id)>;

  ConnectionRegistry(std::shared_ptr<KeyValueStore> store,
                     std::shared_ptr<SecretStore> secrets,
                     std::shared_ptr<EndpointProber> prober,
                     std::shared_ptr<Logger> logger = nullptr);

  // Restores persisted profiles; returns how many were loaded.
  std::size_t load();

  // Probes first. Nothing is stored unless the probe succeeds.
  void add(ConnectionProfile profile, AddCallback done);

  // Both throw NotFoundError for unknown ids.
  ConnectionProfile update(ConnectionProfile profile);
  void remove(const std::string& id);

  // Probes a scanned device and saves it like add(). A device that is
  // already saved reports its stored profile without probing again.
  void connect_device(const DiscoveredDevice& device, AddCallback done);
  // False when the device has no saved profile.
  bool disconnect_device(const DiscoveredDevice& device);

  // Called after a profile is removed (the engine cancels its transfers here).
  void set_removal_hook(RemovalHook hook);

  // Profiles from list()/active() carry no secret; get() fills it in.
  std::vector<ConnectionProfile> list() const;
  std::vector<ConnectionProfile> active() const;
  std::optional<ConnectionProfile> get(const std::string& id) const;

private:
  bool persist_locked(const ConnectionProfile& profile);

  std::shared_ptr<KeyValueStore> store_;
  std::shared_ptr<SecretStore> secrets_;
  std::shared_ptr<EndpointProber> prober_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::map<std::string, ConnectionProfile> profiles_;
  RemovalHook removal_hook_;
};
