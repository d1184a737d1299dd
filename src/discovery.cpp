#include "discovery.hpp"

#include <algorithm>

#include "log.hpp"
#include "net_address.hpp"
#include "utils.hpp"

using tcp = asio::ip::tcp;

const char* to_string(DeviceType type) {
  switch(type) {
    case DeviceType::NetworkService: return "networkService";
    case DeviceType::WifiDirect: return "wifiDirect";
    case DeviceType::Bluetooth: return "bluetooth";
    case DeviceType::Hotspot: return "hotspot";
    case DeviceType::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(ServiceKind kind) {
  switch(kind) {
    case ServiceKind::Http: return "http";
    case ServiceKind::Https: return "https";
    case ServiceKind::Ftp: return "ftp";
    case ServiceKind::Ssh: return "ssh";
    case ServiceKind::Unknown: return "unknown";
  }
  return "unknown";
}

ServiceKind service_for_port(uint16_t port) {
  switch(port) {
    case 21: return ServiceKind::Ftp;
    case 22: return ServiceKind::Ssh;
    case 443: return ServiceKind::Https;
    case 80:
    case 5000:
    case 8000:
    case 8080:
    case 9000:
      return ServiceKind::Http;
    default:
      return ServiceKind::Unknown;
  }
}

nlohmann::json DiscoveredDevice::to_json() const {
  return nlohmann::json{
    {"id", id},
    {"name", name},
    {"ipAddress", ip_address},
    {"port", port},
    {"type", to_string(type)},
    {"service", to_string(service)},
    {"lastSeen", to_epoch_ms(last_seen)},
    {"isOnline", is_online},
  };
}

void UnsupportedPeerDiscovery::discover(std::function<void(const DiscoveredDevice&)>,
                                        std::function<void()> on_done) {
  if(on_done) on_done();
}

struct DiscoveryScan::Probe {
  explicit Probe(asio::io_context& io) : socket(io), timer(io) {}
  tcp::socket socket;
  asio::steady_timer timer;
};

DiscoveryScan::DiscoveryScan(asio::io_context& io,
                             const EngineConfig& config,
                             std::optional<std::string> local_ip,
                             std::shared_ptr<PeerDiscoveryCapability> peer_discovery,
                             std::shared_ptr<Logger> logger,
                             DeviceCallback on_device)
  : io_(io),
    concurrency_(std::max<std::size_t>(1, config.discovery_concurrency)),
    probe_timeout_(config.probe_timeout),
    ports_(config.candidate_ports),
    peer_discovery_(std::move(peer_discovery)),
    logger_(std::move(logger)),
    on_device_(std::move(on_device)) {
  if(local_ip) subnet_ = subnet_prefix(*local_ip);
  if(!subnet_.empty()) {
    hosts_.reserve(254);
    for(int octet = 1; octet <= 254; ++octet) {
      hosts_.push_back(subnet_ + "." + std::to_string(octet));
    }
  }
}

bool DiscoveryScan::start() {
  {
    std::lock_guard lg(m_);
    if(state_ != State::Idle) return false;
    state_ = State::Running;
  }
  auto self = shared_from_this();
  if(hosts_.empty() || ports_.empty()) {
    if(subnet_.empty()) {
      log_warn(logger_.get(), "Local address unknown; skipping subnet scan");
    }
    asio::post(io_, [self](){ self->finish_network_pass(); });
    return true;
  }
  log_info(logger_.get(), "Scanning {}.0/24 on {} ports ({} probes at a time)",
           subnet_, ports_.size(), concurrency_);
  asio::post(io_, [self](){ self->launch_more(); });
  return true;
}

void DiscoveryScan::launch_more() {
  std::vector<std::size_t> to_start;
  {
    std::lock_guard lg(m_);
    while(state_ == State::Running && in_flight_ < concurrency_ && next_host_ < hosts_.size()) {
      to_start.push_back(next_host_++);
      ++in_flight_;
    }
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
  }
  for(auto host : to_start) {
    probe_host(host, 0);
  }
}

void DiscoveryScan::probe_host(std::size_t host_index, std::size_t port_index) {
  std::error_code ec;
  auto address = asio::ip::make_address_v4(hosts_[host_index], ec);
  if(ec) {
    host_done();
    return;
  }
  auto probe = std::make_shared<Probe>(io_);
  bool running = false;
  {
    std::lock_guard lg(m_);
    running = state_ == State::Running;
    if(running) live_probes_.push_back(probe);
  }
  if(!running) {
    host_done();
    return;
  }

  auto self = shared_from_this();
  probe->timer.expires_after(probe_timeout_);
  probe->timer.async_wait([probe](const std::error_code& ec){
    if(ec) return;
    std::error_code ignored;
    probe->socket.close(ignored);
  });
  tcp::endpoint endpoint(address, ports_[port_index]);
  probe->socket.async_connect(endpoint, [this, self, probe, host_index, port_index](std::error_code ec){
    probe->timer.cancel();
    std::error_code ignored;
    probe->socket.close(ignored);

    bool running = false;
    {
      std::lock_guard lg(m_);
      live_probes_.erase(std::remove(live_probes_.begin(), live_probes_.end(), probe), live_probes_.end());
      running = state_ == State::Running;
    }
    if(!ec && running) {
      DiscoveredDevice device;
      device.ip_address = hosts_[host_index];
      device.port = ports_[port_index];
      device.id = device.ip_address + ":" + std::to_string(device.port);
      device.name = "Device at " + device.ip_address;
      device.type = DeviceType::NetworkService;
      device.service = service_for_port(device.port);
      device.last_seen = std::chrono::system_clock::now();
      device.is_online = true;
      record(std::move(device));
      host_done();
      return;
    }
    // first open port wins; otherwise try the next candidate
    if(running && port_index + 1 < ports_.size()) {
      probe_host(host_index, port_index + 1);
      return;
    }
    host_done();
  });
}

void DiscoveryScan::host_done() {
  bool pass_over = false;
  {
    std::lock_guard lg(m_);
    if(in_flight_ > 0) --in_flight_;
    pass_over = in_flight_ == 0 && (next_host_ >= hosts_.size() || state_ != State::Running);
  }
  if(pass_over) {
    finish_network_pass();
  } else {
    launch_more();
  }
}

void DiscoveryScan::finish_network_pass() {
  std::size_t found = 0;
  {
    std::lock_guard lg(m_);
    if(state_ != State::Running) return;
    found = devices_.size();
  }
  if(!hosts_.empty()) {
    log_info(logger_.get(), "Subnet {}.0/24 scanned: {} device(s)", subnet_, found);
  }
  run_peer_discovery();
}

void DiscoveryScan::run_peer_discovery() {
  if(!peer_discovery_ || !peer_discovery_->available()) {
    if(logger_) logger_->debug("Short-range peer discovery not available");
    finish(State::Finished);
    return;
  }
  auto self = shared_from_this();
  try {
    peer_discovery_->discover(
      [self](const DiscoveredDevice& device){ self->record(device); },
      [self](){
        asio::post(self->io_, [self](){ self->finish(State::Finished); });
      });
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Short-range peer discovery failed: {}", e.what());
    finish(State::Finished);
  }
}

void DiscoveryScan::record(DiscoveredDevice device) {
  NextHandler waiter;
  {
    std::lock_guard lg(m_);
    if(state_ != State::Running) return;
    devices_.push_back(device);
    if(!waiters_.empty() && read_index_ < devices_.size()) {
      waiter = std::move(waiters_.front());
      waiters_.pop_front();
      ++read_index_;
    }
  }
  cv_.notify_all();
  log_info(logger_.get(), "Found {} ({})", device.id, to_string(device.service));
  if(waiter) waiter(device);
  if(on_device_) on_device_(device);
}

void DiscoveryScan::finish(State final_state) {
  std::deque<NextHandler> waiters;
  {
    std::lock_guard lg(m_);
    if(state_ == State::Finished || state_ == State::Cancelled) return;
    state_ = final_state;
    waiters.swap(waiters_);
  }
  cv_.notify_all();
  for(auto& waiter : waiters) {
    waiter(std::nullopt);
  }
}

void DiscoveryScan::cancel() {
  std::vector<std::shared_ptr<Probe>> probes;
  {
    std::lock_guard lg(m_);
    if(state_ == State::Finished || state_ == State::Cancelled) return;
    probes = live_probes_;
  }
  finish(State::Cancelled);
  log_info(logger_.get(), "Discovery cancelled");
  auto peer = peer_discovery_;
  asio::post(io_, [probes, peer](){
    for(const auto& probe : probes) {
      std::error_code ignored;
      probe->timer.cancel();
      probe->socket.close(ignored);
    }
    if(peer) peer->cancel();
  });
}

void DiscoveryScan::async_next(NextHandler handler) {
  std::optional<DiscoveredDevice> ready;
  bool over = false;
  {
    std::lock_guard lg(m_);
    if(read_index_ < devices_.size()) {
      ready = devices_[read_index_++];
    } else if(state_ == State::Finished || state_ == State::Cancelled) {
      over = true;
    } else {
      waiters_.push_back(std::move(handler));
      return;
    }
  }
  if(ready || over) handler(ready);
}

bool DiscoveryScan::wait(std::chrono::milliseconds timeout) const {
  std::unique_lock lk(m_);
  return cv_.wait_for(lk, timeout, [this]{
    return state_ == State::Finished || state_ == State::Cancelled;
  });
}

DiscoveryScan::State DiscoveryScan::state() const {
  std::lock_guard lg(m_);
  return state_;
}

bool DiscoveryScan::done() const {
  auto s = state();
  return s == State::Finished || s == State::Cancelled;
}

std::vector<DiscoveredDevice> DiscoveryScan::devices() const {
  std::lock_guard lg(m_);
  return devices_;
}

std::size_t DiscoveryScan::probes_in_flight() const {
  std::lock_guard lg(m_);
  return in_flight_;
}

std::size_t DiscoveryScan::peak_probes_in_flight() const {
  std::lock_guard lg(m_);
  return peak_in_flight_;
}

NetworkDiscoveryEngine::NetworkDiscoveryEngine(asio::io_context& io,
                                               EngineConfig config,
                                               std::shared_ptr<AddressResolver> resolver,
                                               std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    resolver_(resolver ? std::move(resolver) : std::make_shared<SystemAddressResolver>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")),
    peer_discovery_(std::make_shared<UnsupportedPeerDiscovery>()) {}

NetworkDiscoveryEngine::~NetworkDiscoveryEngine() {
  cancel();
}

void NetworkDiscoveryEngine::set_peer_discovery(std::shared_ptr<PeerDiscoveryCapability> capability) {
  std::lock_guard lg(m_);
  peer_discovery_ = capability ? std::move(capability) : std::make_shared<UnsupportedPeerDiscovery>();
}

std::shared_ptr<DiscoveryScan> NetworkDiscoveryEngine::discover() {
  std::shared_ptr<DiscoveryScan> scan;
  {
    std::lock_guard lg(m_);
    if(current_ && !current_->done()) return current_;
    scan = std::make_shared<DiscoveryScan>(io_, config_, resolver_->local_ip(), peer_discovery_, logger_,
      [this](const DiscoveredDevice& device){ discovered_.notify(device); });
    current_ = scan;
  }
  scan->start();
  return scan;
}

void NetworkDiscoveryEngine::cancel() {
  std::shared_ptr<DiscoveryScan> scan;
  {
    std::lock_guard lg(m_);
    scan = current_;
  }
  if(scan) scan->cancel();
}

bool NetworkDiscoveryEngine::scanning() const {
  std::lock_guard lg(m_);
  return current_ && !current_->done();
}

std::vector<DiscoveredDevice> NetworkDiscoveryEngine::discovered_devices() const {
  std::lock_guard lg(m_);
  return current_ ? current_->devices() : std::vector<DiscoveredDevice>();
}

void NetworkDiscoveryEngine::test_connection(const std::string& host,
                                             uint16_t port,
                                             std::function<void(bool)> done) {
  auto resolver = std::make_shared<tcp::resolver>(io_);
  auto socket = std::make_shared<tcp::socket>(io_);
  auto timer = std::make_shared<asio::steady_timer>(io_);
  auto timeout = config_.connect_timeout;
  auto logger = logger_;
  auto target = host + ":" + std::to_string(port);
  asio::post(io_, [=](){
    resolver->async_resolve(host, std::to_string(port),
      [=](std::error_code ec, tcp::resolver::results_type results){
        if(ec) {
          log_info(logger.get(), "Connection test to {} failed: {}", target, ec.message());
          if(done) done(false);
          return;
        }
        timer->expires_after(timeout);
        timer->async_wait([socket](const std::error_code& ec){
          if(ec) return;
          std::error_code ignored;
          socket->close(ignored);
        });
        asio::async_connect(*socket, results, [=](std::error_code ec, const tcp::endpoint&){
          timer->cancel();
          std::error_code ignored;
          socket->close(ignored);
          log_info(logger.get(), "Connection test to {}: {}", target, ec ? ec.message() : std::string("reachable"));
          if(done) done(!ec);
        });
      });
  });
}

SubscriptionHandle NetworkDiscoveryEngine::on_discovered(std::function<void(const DiscoveredDevice&)> listener) {
  return discovered_.add(std::move(listener));
}

void NetworkDiscoveryEngine::remove_discovered_listener(SubscriptionHandle handle) {
  discovered_.remove(handle);
}
