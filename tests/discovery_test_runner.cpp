#include "discovery.hpp"
#include "net_address.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using lanshare::test::IoThread;
using lanshare::test::TestCase;
using lanshare::test::TestContext;
using lanshare::test::Waiter;
using namespace std::chrono_literals;

namespace {

// Short-range capability that reports one peer and then stays busy until
// cancelled, so the scan cannot finish on its own.
class HangingPeerDiscovery : public PeerDiscoveryCapability {
public:
  bool available() const override { return true; }

  void discover(std::function<void(const DiscoveredDevice&)> on_device,
                std::function<void()> on_done) override {
    DiscoveredDevice peer;
    peer.id = "wifi-direct:phone";
    peer.name = "Phone";
    peer.type = DeviceType::WifiDirect;
    on_device(peer);
    std::lock_guard<std::mutex> lock(m_);
    on_done_ = std::move(on_done);
  }

  void cancel() override {
    cancelled = true;
  }

  std::atomic<bool> cancelled{false};

private:
  std::mutex m_;
  std::function<void()> on_done_;
};

EngineConfig scan_config(std::vector<uint16_t> ports) {
  EngineConfig config;
  config.candidate_ports = std::move(ports);
  config.discovery_concurrency = 4;
  config.probe_timeout = 300ms;
  config.connect_timeout = 1s;
  return config;
}

bool test_finds_listening_loopback_port(TestContext& ctx) {
  IoThread io;
  asio::ip::tcp::acceptor listener(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto open_port = listener.local_endpoint().port();
  auto closed_port = lanshare::test::unused_local_port();

  NetworkDiscoveryEngine engine(io.io(), scan_config({closed_port, open_port}),
                                std::make_shared<FixedAddressResolver>("127.0.0.7"),
                                ctx.logs.make_logger("discovery"));
  std::atomic<int> notified{0};
  auto handle = engine.on_discovered([&notified](const DiscoveredDevice&){ ++notified; });

  auto scan = engine.discover();
  LANSHARE_CHECK(ctx, scan->subnet() == "127.0.0");
  LANSHARE_CHECK(ctx, scan->wait(60s));
  engine.remove_discovered_listener(handle);

  LANSHARE_CHECK(ctx, scan->state() == DiscoveryScan::State::Finished);
  auto devices = scan->devices();
  LANSHARE_CHECK(ctx, devices.size() == 1);
  LANSHARE_CHECK(ctx, devices[0].ip_address == "127.0.0.1");
  LANSHARE_CHECK(ctx, devices[0].port == open_port);
  LANSHARE_CHECK(ctx, devices[0].id == "127.0.0.1:" + std::to_string(open_port));
  LANSHARE_CHECK(ctx, devices[0].type == DeviceType::NetworkService);
  LANSHARE_CHECK(ctx, devices[0].is_online);
  LANSHARE_CHECK(ctx, notified == 1);
  LANSHARE_CHECK(ctx, scan->peak_probes_in_flight() <= 4);
  LANSHARE_CHECK(ctx, scan->peak_probes_in_flight() >= 1);
  LANSHARE_CHECK(ctx, scan->probes_in_flight() == 0);
  LANSHARE_CHECK(ctx, engine.discovered_devices().size() == 1);
  LANSHARE_CHECK(ctx, !engine.scanning());
  return true;
}

bool test_unknown_address_gives_empty_result(TestContext& ctx) {
  IoThread io;
  NetworkDiscoveryEngine engine(io.io(), scan_config({80}), std::make_shared<FixedAddressResolver>(""),
                                ctx.logs.make_logger("discovery"));
  auto scan = engine.discover();
  LANSHARE_CHECK(ctx, scan->wait(5s));
  LANSHARE_CHECK(ctx, scan->state() == DiscoveryScan::State::Finished);
  LANSHARE_CHECK(ctx, scan->subnet().empty());
  LANSHARE_CHECK(ctx, scan->devices().empty());
  LANSHARE_CHECK(ctx, ctx.logs.contains("Local address unknown"));

  Waiter<std::optional<DiscoveredDevice>> next;
  scan->async_next(next.callback());
  auto item = next.wait(1s);
  LANSHARE_CHECK(ctx, item.has_value());
  LANSHARE_CHECK(ctx, !item->has_value());
  LANSHARE_CHECK(ctx, !scan->start());
  return true;
}

bool test_cancel_stops_peer_discovery(TestContext& ctx) {
  IoThread io;
  auto peer = std::make_shared<HangingPeerDiscovery>();
  NetworkDiscoveryEngine engine(io.io(), scan_config({80}), std::make_shared<FixedAddressResolver>(""),
                                ctx.logs.make_logger("discovery"));
  engine.set_peer_discovery(peer);

  auto scan = engine.discover();
  Waiter<std::optional<DiscoveredDevice>> first;
  scan->async_next(first.callback());
  auto item = first.wait(5s);
  LANSHARE_CHECK(ctx, item.has_value() && item->has_value());
  LANSHARE_CHECK(ctx, (*item)->type == DeviceType::WifiDirect);
  LANSHARE_CHECK(ctx, !scan->wait(200ms));
  LANSHARE_CHECK(ctx, engine.scanning());

  Waiter<std::optional<DiscoveredDevice>> pending;
  scan->async_next(pending.callback());
  engine.cancel();
  auto tail = pending.wait(5s);
  LANSHARE_CHECK(ctx, tail.has_value());
  LANSHARE_CHECK(ctx, !tail->has_value());
  LANSHARE_CHECK(ctx, scan->state() == DiscoveryScan::State::Cancelled);
  LANSHARE_CHECK(ctx, lanshare::test::wait_for_condition([&]{ return peer->cancelled.load(); }, 2s));
  LANSHARE_CHECK(ctx, !engine.scanning());

  auto again = engine.discover();
  LANSHARE_CHECK(ctx, again != scan);
  engine.cancel();
  return true;
}

bool test_connection_check(TestContext& ctx) {
  IoThread io;
  asio::ip::tcp::acceptor listener(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  NetworkDiscoveryEngine engine(io.io(), scan_config({80}), std::make_shared<FixedAddressResolver>("127.0.0.1"),
                                ctx.logs.make_logger("discovery"));

  Waiter<bool> open;
  engine.test_connection("127.0.0.1", listener.local_endpoint().port(), open.callback());
  auto reachable = open.wait(5s);
  LANSHARE_CHECK(ctx, reachable.has_value() && *reachable);

  Waiter<bool> closed;
  engine.test_connection("127.0.0.1", lanshare::test::unused_local_port(), closed.callback());
  auto refused = closed.wait(5s);
  LANSHARE_CHECK(ctx, refused.has_value() && !*refused);
  return true;
}

bool test_service_guess(TestContext& ctx) {
  LANSHARE_CHECK(ctx, service_for_port(21) == ServiceKind::Ftp);
  LANSHARE_CHECK(ctx, service_for_port(22) == ServiceKind::Ssh);
  LANSHARE_CHECK(ctx, service_for_port(443) == ServiceKind::Https);
  LANSHARE_CHECK(ctx, service_for_port(8080) == ServiceKind::Http);
  LANSHARE_CHECK(ctx, service_for_port(12345) == ServiceKind::Unknown);
  LANSHARE_CHECK(ctx, subnet_prefix("192.168.1.23") == "192.168.1");
  LANSHARE_CHECK(ctx, subnet_prefix("fe80::1").empty());
  LANSHARE_CHECK(ctx, in_subnet("192.168.1.200", "192.168.1"));
  LANSHARE_CHECK(ctx, !in_subnet("192.168.10.2", "192.168.1"));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"finds_listening_loopback_port", test_finds_listening_loopback_port},
    {"unknown_address_gives_empty_result", test_unknown_address_gives_empty_result},
    {"cancel_stops_peer_discovery", test_cancel_stops_peer_discovery},
    {"connection_check", test_connection_check},
    {"service_guess", test_service_guess},
  };
  return lanshare::test::run_test_cases("discovery", tests, argc, argv);
}
