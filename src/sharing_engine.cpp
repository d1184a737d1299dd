#include "sharing_engine.hpp"

#include <stdexcept>

#include "connection_registry.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "net_address.hpp"
#include "settings_manager.hpp"
#include "share_registry.hpp"
#include "sharing_server.hpp"
#include "storage.hpp"
#include "transfer_manager.hpp"

SharingEngine::SharingEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("engine")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SharingEngine::~SharingEngine() {
  stop();
}

void SharingEngine::start() {
  if(started_) return;
  // queued handlers still point at the components of the first run
  if(stopped_) throw std::logic_error("SharingEngine cannot be restarted after stop()");

  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "lanshare.json");
  }
  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));

  config_ = EngineConfig::from_settings(*settings_, options_.workspace_root);
  std::filesystem::create_directories(config_.data_dir, ec);
  if(ec) {
    logger_->error("Cannot create data directory {}: {}", config_.data_dir.string(), ec.message());
    throw std::runtime_error("cannot create data directory " + config_.data_dir.string());
  }

  if(!options_.store) {
    options_.store = std::make_shared<FileKeyValueStore>(config_.data_dir);
  }
  if(!options_.secrets) {
    options_.secrets = std::make_shared<FileSecretStore>(config_.data_dir / "secrets");
  }
  if(!options_.resolver) {
    if(config_.local_ip_override.empty()) {
      options_.resolver = std::make_shared<SystemAddressResolver>();
    } else {
      options_.resolver = std::make_shared<FixedAddressResolver>(config_.local_ip_override);
    }
  }
  if(!options_.prober) {
    options_.prober = std::make_shared<NetworkProber>(io_, config_, std::make_shared<Logger>("connections"));
  }

  shares_ = std::make_shared<ShareLinkRegistry>(options_.store, config_, options_.resolver,
                                                std::make_shared<Logger>("shares"));
  transfers_ = std::make_unique<TransferManager>(io_, config_, std::make_shared<Logger>("transfers"));
  connections_ = std::make_unique<ConnectionRegistry>(options_.store, options_.secrets, options_.prober,
                                                      std::make_shared<Logger>("connections"));
  discovery_ = std::make_unique<NetworkDiscoveryEngine>(io_, config_, options_.resolver,
                                                        std::make_shared<Logger>("discovery"));
  server_ = std::make_unique<LocalSharingServer>(io_, config_, options_.resolver,
                                                 std::make_shared<Logger>("sharing-server"));
  server_->attach_share_registry(shares_);

  auto* transfers = transfers_.get();
  connections_->set_removal_hook([transfers](const std::string& id){
    transfers->cancel_for_connection(id);
  });
  connections_->load();

  auto ip = options_.resolver->local_ip();
  logger_->info("Engine ready (device {}, local ip {})", config_.device_id, ip.value_or("unknown"));
  started_ = true;
}

void SharingEngine::run() {
  if(!started_) start();
  io_.run();
}

void SharingEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  work_.emplace(asio::make_work_guard(io_));
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SharingEngine::stop() {
  if(!started_) return;
  started_ = false;
  stopped_ = true;

  if(server_) server_->stop();
  if(discovery_) discovery_->cancel();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
}

void SharingEngine::require_started() const {
  if(!transfers_) throw std::logic_error("SharingEngine::start() has not been called");
}

ConnectionRegistry& SharingEngine::connections() {
  require_started();
  return *connections_;
}

NetworkDiscoveryEngine& SharingEngine::discovery() {
  require_started();
  return *discovery_;
}

ShareLinkRegistry& SharingEngine::shares() {
  require_started();
  return *shares_;
}

TransferManager& SharingEngine::transfers() {
  require_started();
  return *transfers_;
}

LocalSharingServer& SharingEngine::server() {
  require_started();
  return *server_;
}

TransferTask SharingEngine::upload_to(const std::string& connection_id,
                                      const std::filesystem::path& local_path,
                                      const std::string& remote_path) {
  require_started();
  auto profile = connections_->get(connection_id);
  if(!profile) throw NotFoundError("unknown connection " + connection_id);
  return transfers_->enqueue_upload(Endpoint::from_profile(*profile), local_path, remote_path);
}

TransferTask SharingEngine::download_from(const std::string& connection_id,
                                          const std::string& remote_path,
                                          const std::filesystem::path& local_path) {
  require_started();
  auto profile = connections_->get(connection_id);
  if(!profile) throw NotFoundError("unknown connection " + connection_id);
  return transfers_->enqueue_download(Endpoint::from_profile(*profile), remote_path, local_path);
}

TransferTask SharingEngine::upload_to_device(const DiscoveredDevice& device,
                                             const std::filesystem::path& local_path,
                                             const std::string& remote_path) {
  require_started();
  return transfers_->enqueue_upload(Endpoint::from_device(device), local_path, remote_path);
}

TransferTask SharingEngine::download_from_device(const DiscoveredDevice& device,
                                                 const std::string& remote_path,
                                                 const std::filesystem::path& local_path) {
  require_started();
  return transfers_->enqueue_download(Endpoint::from_device(device), remote_path, local_path);
}
