#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "engine_config.hpp"
#include "subscription.hpp"

class AddressResolver;
class Logger;
class ShareLinkRegistry;

enum class ServerStatus { Stopped, Starting, Running, Stopping };

const char* to_string(ServerStatus status);

struct ServerState {
  ServerStatus status = ServerStatus::Stopped;
  std::string bind_address;
  uint16_t port = 0;
  std::filesystem::path root_path;
  std::string server_url;

  bool is_running() const { return status == ServerStatus::Running; }
  nlohmann::json to_json() const;
};

// Read-only state shared by every session of one server run.
struct SharingServerContext {
  std::filesystem::path root;             // canonical
  uint64_t max_upload_bytes = 0;
  std::chrono::milliseconds io_timeout{30000};
  std::shared_ptr<ShareLinkRegistry> shares;
  std::shared_ptr<Logger> logger;
  std::atomic<std::size_t> sessions{0};
};

// Embedded HTTP/1.1 file server:
//   GET|HEAD /            listing of the root (HTML, or JSON with ?format=json
//                         or Accept: application/json)
//   GET|HEAD /<path>      file bytes, or a listing for a directory
//   POST /upload          multipart/form-data, every file part lands in root
//   GET /file/<id>        single-file share
//   GET /files/<id>[/<n>] multi-file share listing / n-th file
//   OPTIONS *             CORS preflight
class LocalSharingServer {
public:
  LocalSharingServer(asio::io_context& io,
                     EngineConfig config,
                     std::shared_ptr<AddressResolver> resolver,
                     std::shared_ptr<Logger> logger = nullptr);
  ~LocalSharingServer();

  LocalSharingServer(const LocalSharingServer&) = delete;
  LocalSharingServer& operator=(const LocalSharingServer&) = delete;

  // Takes effect on the next start().
  void attach_share_registry(std::shared_ptr<ShareLinkRegistry> shares);

  // Throws ServerError when already running, when root is not a directory,
  // or when the port cannot be bound. port 0 picks an ephemeral port; no
  // port uses the configured one.
  ServerState start(const std::filesystem::path& root, std::optional<uint16_t> port = std::nullopt);

  // No-op when stopped. Sessions already accepted finish their response.
  void stop();

  ServerState state() const;
  bool running() const;
  std::size_t open_sessions() const;

  SubscriptionHandle on_server_state_changed(std::function<void(const ServerState&)> listener);
  void remove_state_listener(SubscriptionHandle handle);

private:
  void do_accept(std::shared_ptr<asio::ip::tcp::acceptor> acceptor, uint64_t generation);
  void set_state(ServerState state);
  std::string url_host(const std::string& bind_address) const;

  asio::io_context& io_;
  EngineConfig config_;
  std::shared_ptr<AddressResolver> resolver_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  ServerState state_;
  std::shared_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::shared_ptr<SharingServerContext> context_;
  std::shared_ptr<ShareLinkRegistry> shares_;
  uint64_t generation_ = 0;

  Subscribers<ServerState> state_listeners_;
};
