#pragma once

#include <asio.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "engine_config.hpp"

class AddressResolver;
class ConnectionRegistry;
class EndpointProber;
class KeyValueStore;
class LocalSharingServer;
class Logger;
class NetworkDiscoveryEngine;
class SecretStore;
class SettingsManager;
class ShareLinkRegistry;
class TransferManager;
struct DiscoveredDevice;
struct TransferTask;

// Owns the io_context and every sharing component. Collaborators left empty
// in Options get file-backed / system defaults under the workspace.
class SharingEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::shared_ptr<KeyValueStore> store;
    std::shared_ptr<SecretStore> secrets;
    std::shared_ptr<AddressResolver> resolver;
    std::shared_ptr<EndpointProber> prober;
  };

  SharingEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SharingEngine();

  SharingEngine(const SharingEngine&) = delete;
  SharingEngine& operator=(const SharingEngine&) = delete;

  // An engine runs once: start() after stop() throws std::logic_error.
  void start();
  void run();
  void start_background();
  void stop();

  asio::io_context& io() { return io_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const EngineConfig& config() const { return config_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  ConnectionRegistry& connections();
  NetworkDiscoveryEngine& discovery();
  ShareLinkRegistry& shares();
  TransferManager& transfers();
  LocalSharingServer& server();

  // Transfers against a saved connection; throw NotFoundError for unknown ids.
  TransferTask upload_to(const std::string& connection_id,
                         const std::filesystem::path& local_path,
                         const std::string& remote_path = std::string());
  TransferTask download_from(const std::string& connection_id,
                             const std::string& remote_path,
                             const std::filesystem::path& local_path);

  TransferTask upload_to_device(const DiscoveredDevice& device,
                                const std::filesystem::path& local_path,
                                const std::string& remote_path = std::string());
  TransferTask download_from_device(const DiscoveredDevice& device,
                                    const std::string& remote_path,
                                    const std::filesystem::path& local_path);

private:
  void require_started() const;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  EngineConfig config_;
  bool started_ = false;
  bool stopped_ = false;

  std::shared_ptr<ShareLinkRegistry> shares_;
  std::unique_ptr<TransferManager> transfers_;
  std::unique_ptr<ConnectionRegistry> connections_;
  std::unique_ptr<NetworkDiscoveryEngine> discovery_;
  std::unique_ptr<LocalSharingServer> server_;
};
