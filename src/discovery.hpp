#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "subscription.hpp"

class AddressResolver;
class Logger;

enum class DeviceType { NetworkService, WifiDirect, Bluetooth, Hotspot, Unknown };

// Service category guessed from the port that answered.
enum class ServiceKind { Http, Https, Ftp, Ssh, Unknown };

const char* to_string(DeviceType type);
const char* to_string(ServiceKind kind);
ServiceKind service_for_port(uint16_t port);

struct DiscoveredDevice {
  std::string id;           // "ip:port"
  std::string name;
  std::string ip_address;
  uint16_t port = 0;
  DeviceType type = DeviceType::NetworkService;
  ServiceKind service = ServiceKind::Unknown;
  std::chrono::system_clock::time_point last_seen{};
  bool is_online = true;

  nlohmann::json to_json() const;
};

// Platform short-range discovery (WiFi Direct, Bluetooth, hotspot peers).
// The engine only calls through this interface.
class PeerDiscoveryCapability {
public:
  virtual ~PeerDiscoveryCapability() = default;

  virtual bool available() const = 0;
  // on_done must be called exactly once, after the last on_device.
  virtual void discover(std::function<void(const DiscoveredDevice&)> on_device,
                        std::function<void()> on_done) = 0;
  virtual void cancel() {}
};

class UnsupportedPeerDiscovery : public PeerDiscoveryCapability {
public:
  bool available() const override { return false; }
  void discover(std::function<void(const DiscoveredDevice&)> on_device,
                std::function<void()> on_done) override;
};

// One pass over the local /24. Devices can be pulled one at a time with
// async_next() or read in bulk with devices(); the pass cannot be restarted.
class DiscoveryScan : public std::enable_shared_from_this<DiscoveryScan> {
public:
  enum class State { Idle, Running, Finished, Cancelled };

  using NextHandler = std::function<void(std::optional<DiscoveredDevice>)>;
  using DeviceCallback = std::function<void(const DiscoveredDevice&)>;

  DiscoveryScan(asio::io_context& io,
                const EngineConfig& config,
                std::optional<std::string> local_ip,
                std::shared_ptr<PeerDiscoveryCapability> peer_discovery,
                std::shared_ptr<Logger> logger,
                DeviceCallback on_device);

  // False when the scan already ran.
  bool start();
  void cancel();

  // Next device not yet handed out, or nullopt once the scan is over.
  void async_next(NextHandler handler);

  bool wait(std::chrono::milliseconds timeout) const;

  State state() const;
  bool done() const;
  std::vector<DiscoveredDevice> devices() const;
  const std::string& subnet() const { return subnet_; }
  std::size_t probes_in_flight() const;
  std::size_t peak_probes_in_flight() const;

private:
  struct Probe;

  void launch_more();
  void probe_host(std::size_t host_index, std::size_t port_index);
  void host_done();
  void finish_network_pass();
  void run_peer_discovery();
  void record(DiscoveredDevice device);
  void finish(State final_state);

  asio::io_context& io_;
  std::size_t concurrency_;
  std::chrono::milliseconds probe_timeout_;
  std::vector<uint16_t> ports_;
  std::string subnet_;
  std::vector<std::string> hosts_;
  std::shared_ptr<PeerDiscoveryCapability> peer_discovery_;
  std::shared_ptr<Logger> logger_;
  DeviceCallback on_device_;

  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  State state_ = State::Idle;
  std::size_t next_host_ = 0;
  std::size_t in_flight_ = 0;
  std::size_t peak_in_flight_ = 0;
  std::vector<DiscoveredDevice> devices_;
  std::size_t read_index_ = 0;
  std::deque<NextHandler> waiters_;
  std::vector<std::shared_ptr<Probe>> live_probes_;
};

class NetworkDiscoveryEngine {
public:
  NetworkDiscoveryEngine(asio::io_context& io,
                         EngineConfig config,
                         std::shared_ptr<AddressResolver> resolver,
                         std::shared_ptr<Logger> logger = nullptr);
  ~NetworkDiscoveryEngine();

  void set_peer_discovery(std::shared_ptr<PeerDiscoveryCapability> capability);

  // Starts a new scan, or returns the one still running.
  std::shared_ptr<DiscoveryScan> discover();
  void cancel();
  bool scanning() const;
  std::vector<DiscoveredDevice> discovered_devices() const;

  // Single TCP reachability check with the connect timeout.
  void test_connection(const std::string& host, uint16_t port, std::function<void(bool)> done);

  SubscriptionHandle on_discovered(std::function<void(const DiscoveredDevice&)> listener);
  void remove_discovered_listener(SubscriptionHandle handle);

private:
  asio::io_context& io_;
  EngineConfig config_;
  std::shared_ptr<AddressResolver> resolver_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::shared_ptr<PeerDiscoveryCapability> peer_discovery_;
  std::shared_ptr<DiscoveryScan> current_;
  Subscribers<DiscoveredDevice> discovered_;
};
