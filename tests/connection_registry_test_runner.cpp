#include "connection_registry.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "fake_ftp_server.hpp"
#include "storage.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <sys/stat.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using lanshare::test::FakeFtpServer;
using lanshare::test::IoThread;
using lanshare::test::TempWorkspace;
using lanshare::test::TestCase;
using lanshare::test::TestContext;
using lanshare::test::Waiter;
using namespace std::chrono_literals;

namespace {

// Answers every probe inline with a canned result and remembers what it saw.
class ScriptedProber : public EndpointProber {
public:
  explicit ScriptedProber(ProbeResult result) : result_(std::move(result)) {}

  void probe(const ConnectionProfile& profile, Completion done) override {
    seen.push_back(profile);
    done(result_);
  }

  std::vector<ConnectionProfile> seen;

private:
  ProbeResult result_;
};

ProbeResult probe_ok() {
  ProbeResult r;
  r.success = true;
  return r;
}

ConnectionProfile ftp_profile(const std::string& host, uint16_t port) {
  ConnectionProfile p;
  p.name = "nas";
  p.host = host;
  p.port = port;
  p.protocol = TransferProtocol::Ftp;
  p.user = "alice";
  p.secret = "s3cret";
  return p;
}

// Memory store whose saves can be switched off mid-test.
class FlakyStore : public MemoryKeyValueStore {
public:
  bool save(const std::string& key, const std::string& bytes) override {
    if(fail_saves) return false;
    return MemoryKeyValueStore::save(key, bytes);
  }

  bool fail_saves = false;
};

DiscoveredDevice lan_device(const std::string& ip, uint16_t port) {
  DiscoveredDevice d;
  d.id = ip + ":" + std::to_string(port);
  d.name = "Device at " + ip;
  d.ip_address = ip;
  d.port = port;
  d.service = service_for_port(port);
  return d;
}

AddConnectionResult add_sync(ConnectionRegistry& registry, ConnectionProfile profile) {
  AddConnectionResult out;
  registry.add(std::move(profile), [&out](const AddConnectionResult& r){ out = r; });
  return out;
}

bool test_add_persists_profile_and_secret(TestContext& ctx) {
  auto store = std::make_shared<MemoryKeyValueStore>();
  auto secrets = std::make_shared<MemorySecretStore>();
  auto prober = std::make_shared<ScriptedProber>(probe_ok());
  ConnectionRegistry registry(store, secrets, prober, ctx.logs.make_logger("connections"));

  auto r = add_sync(registry, ftp_profile("  192.168.1.40 ", 0));
  LANSHARE_CHECK(ctx, r.success);
  LANSHARE_CHECK(ctx, r.profile.id.compare(0, 5, "conn-") == 0);
  LANSHARE_CHECK(ctx, r.profile.host == "192.168.1.40");
  LANSHARE_CHECK(ctx, r.profile.is_active);
  LANSHARE_CHECK(ctx, r.profile.last_connected.has_value());
  LANSHARE_CHECK(ctx, prober->seen.size() == 1);
  LANSHARE_CHECK(ctx, prober->seen[0].effective_port() == 21);

  auto bytes = store->load("connections/" + r.profile.id);
  LANSHARE_CHECK(ctx, bytes.has_value());
  LANSHARE_CHECK(ctx, bytes->find("s3cret") == std::string::npos);
  auto j = nlohmann::json::parse(*bytes);
  LANSHARE_CHECK(ctx, j["user"] == "alice");
  LANSHARE_CHECK(ctx, !j.contains("secret"));
  LANSHARE_CHECK(ctx, secrets->get(r.profile.id).value_or("") == "s3cret");

  auto listed = registry.list();
  LANSHARE_CHECK(ctx, listed.size() == 1);
  LANSHARE_CHECK(ctx, listed[0].secret.empty());
  LANSHARE_CHECK(ctx, registry.active().size() == 1);
  auto fetched = registry.get(r.profile.id);
  LANSHARE_CHECK(ctx, fetched.has_value());
  LANSHARE_CHECK(ctx, fetched->secret == "s3cret");
  return true;
}

bool test_failed_probe_stores_nothing(TestContext& ctx) {
  auto store = std::make_shared<MemoryKeyValueStore>();
  auto secrets = std::make_shared<MemorySecretStore>();
  ProbeResult refused;
  refused.error = "connection refused";
  ConnectionRegistry registry(store, secrets, std::make_shared<ScriptedProber>(refused),
                              ctx.logs.make_logger("connections"));

  auto profile = ftp_profile("10.0.0.9", 2121);
  profile.id = "conn-fixed";
  auto r = add_sync(registry, profile);
  LANSHARE_CHECK(ctx, !r.success);
  LANSHARE_CHECK(ctx, r.error_kind == ErrorKind::Connectivity);
  LANSHARE_CHECK(ctx, r.error == "connection refused");
  LANSHARE_CHECK(ctx, registry.list().empty());
  LANSHARE_CHECK(ctx, store->list_keys("connections/").empty());
  LANSHARE_CHECK(ctx, !secrets->get("conn-fixed").has_value());
  return true;
}

bool test_rejects_bad_input(TestContext& ctx) {
  auto prober = std::make_shared<ScriptedProber>(probe_ok());
  ConnectionRegistry registry(std::make_shared<MemoryKeyValueStore>(), std::make_shared<MemorySecretStore>(),
                              prober, ctx.logs.make_logger("connections"));

  auto r = add_sync(registry, ftp_profile("   ", 21));
  LANSHARE_CHECK(ctx, !r.success);
  LANSHARE_CHECK(ctx, r.error_kind == ErrorKind::Protocol);

  auto bad_id = ftp_profile("host", 21);
  bad_id.id = "../escape";
  r = add_sync(registry, bad_id);
  LANSHARE_CHECK(ctx, !r.success);

  auto dup = ftp_profile("host", 21);
  dup.id = "conn-dup";
  LANSHARE_CHECK(ctx, add_sync(registry, dup).success);
  r = add_sync(registry, dup);
  LANSHARE_CHECK(ctx, !r.success);
  LANSHARE_CHECK(ctx, r.error_kind == ErrorKind::Protocol);
  LANSHARE_CHECK(ctx, prober->seen.size() == 1);
  LANSHARE_CHECK(ctx, registry.list().size() == 1);
  return true;
}

bool test_update_and_remove(TestContext& ctx) {
  auto store = std::make_shared<MemoryKeyValueStore>();
  auto secrets = std::make_shared<MemorySecretStore>();
  ConnectionRegistry registry(store, secrets, std::make_shared<ScriptedProber>(probe_ok()),
                              ctx.logs.make_logger("connections"));
  std::vector<std::string> removed;
  registry.set_removal_hook([&removed](const std::string& id){ removed.push_back(id); });

  auto added = add_sync(registry, ftp_profile("nas.local", 21));
  LANSHARE_CHECK(ctx, added.success);

  auto changed = added.profile;
  changed.name = "renamed";
  changed.remote_path = "/incoming";
  changed.created_at = std::chrono::system_clock::time_point{};
  auto updated = registry.update(changed);
  LANSHARE_CHECK(ctx, updated.created_at == added.profile.created_at);
  LANSHARE_CHECK(ctx, updated.updated_at >= added.profile.updated_at);
  LANSHARE_CHECK(ctx, registry.get(added.profile.id)->name == "renamed");

  bool threw = false;
  auto ghost = ftp_profile("ghost", 21);
  ghost.id = "conn-ghost";
  try {
    registry.update(ghost);
  } catch(const NotFoundError&) {
    threw = true;
  }
  LANSHARE_CHECK(ctx, threw);

  registry.remove(added.profile.id);
  LANSHARE_CHECK(ctx, removed.size() == 1);
  LANSHARE_CHECK(ctx, removed[0] == added.profile.id);
  LANSHARE_CHECK(ctx, registry.list().empty());
  LANSHARE_CHECK(ctx, !store->load("connections/" + added.profile.id).has_value());
  LANSHARE_CHECK(ctx, !secrets->get(added.profile.id).has_value());

  threw = false;
  try {
    registry.remove(added.profile.id);
  } catch(const NotFoundError&) {
    threw = true;
  }
  LANSHARE_CHECK(ctx, threw);
  return true;
}

bool test_failed_update_keeps_secret(TestContext& ctx) {
  auto store = std::make_shared<FlakyStore>();
  auto secrets = std::make_shared<MemorySecretStore>();
  ConnectionRegistry registry(store, secrets, std::make_shared<ScriptedProber>(probe_ok()),
                              ctx.logs.make_logger("connections"));
  auto added = add_sync(registry, ftp_profile("nas.local", 21));
  LANSHARE_CHECK(ctx, added.success);
  auto id = added.profile.id;

  store->fail_saves = true;
  auto changed = added.profile;
  changed.name = "renamed";
  changed.secret = "rotated";
  bool threw = false;
  try {
    registry.update(changed);
  } catch(const std::runtime_error&) {
    threw = true;
  }
  LANSHARE_CHECK(ctx, threw);
  LANSHARE_CHECK(ctx, registry.get(id)->name == "nas");
  LANSHARE_CHECK(ctx, registry.get(id)->secret == "s3cret");
  LANSHARE_CHECK(ctx, secrets->get(id).value_or("") == "s3cret");

  store->fail_saves = false;
  LANSHARE_CHECK(ctx, registry.update(changed).secret == "rotated");
  LANSHARE_CHECK(ctx, registry.get(id)->secret == "rotated");

  // a first secret that never got a stored profile is dropped again
  auto fresh = ftp_profile("printer.local", 21);
  fresh.id = "conn-fresh";
  store->fail_saves = true;
  LANSHARE_CHECK(ctx, !add_sync(registry, fresh).success);
  LANSHARE_CHECK(ctx, !secrets->get("conn-fresh").has_value());
  return true;
}

bool test_connect_discovered_device(TestContext& ctx) {
  auto store = std::make_shared<MemoryKeyValueStore>();
  auto prober = std::make_shared<ScriptedProber>(probe_ok());
  ConnectionRegistry registry(store, std::make_shared<MemorySecretStore>(), prober,
                              ctx.logs.make_logger("connections"));
  std::vector<std::string> removed;
  registry.set_removal_hook([&removed](const std::string& id){ removed.push_back(id); });

  auto web = lan_device("192.168.1.60", 8080);
  auto first = add_sync(registry, ConnectionProfile::from_device(web));
  LANSHARE_CHECK(ctx, first.success);
  LANSHARE_CHECK(ctx, registry.disconnect_device(web));

  AddConnectionResult connected;
  registry.connect_device(web, [&connected](const AddConnectionResult& r){ connected = r; });
  LANSHARE_CHECK(ctx, connected.success);
  LANSHARE_CHECK(ctx, connected.profile.id == "device-192.168.1.60-8080");
  LANSHARE_CHECK(ctx, connected.profile.name == "Device at 192.168.1.60");
  LANSHARE_CHECK(ctx, connected.profile.protocol == TransferProtocol::Http);
  LANSHARE_CHECK(ctx, connected.profile.effective_port() == 8080);
  LANSHARE_CHECK(ctx, connected.profile.is_active);
  LANSHARE_CHECK(ctx, store->load("connections/device-192.168.1.60-8080").has_value());
  LANSHARE_CHECK(ctx, prober->seen.size() == 2);

  AddConnectionResult again;
  registry.connect_device(web, [&again](const AddConnectionResult& r){ again = r; });
  LANSHARE_CHECK(ctx, again.success);
  LANSHARE_CHECK(ctx, again.profile.id == connected.profile.id);
  LANSHARE_CHECK(ctx, prober->seen.size() == 2);
  LANSHARE_CHECK(ctx, registry.list().size() == 1);

  auto nas = ConnectionProfile::from_device(lan_device("192.168.1.61", 21));
  LANSHARE_CHECK(ctx, nas.protocol == TransferProtocol::Ftp);
  LANSHARE_CHECK(ctx, ConnectionProfile::from_device(lan_device("192.168.1.62", 22)).protocol == TransferProtocol::Sftp);
  auto tls = ConnectionProfile::from_device(lan_device("192.168.1.63", 443));
  LANSHARE_CHECK(ctx, tls.protocol == TransferProtocol::Https);
  LANSHARE_CHECK(ctx, tls.base_url() == "https://192.168.1.63:443");

  LANSHARE_CHECK(ctx, registry.disconnect_device(web));
  LANSHARE_CHECK(ctx, !registry.disconnect_device(web));
  LANSHARE_CHECK(ctx, registry.list().empty());
  LANSHARE_CHECK(ctx, (removed == std::vector<std::string>{connected.profile.id, connected.profile.id}));

  ProbeResult refused;
  refused.error = "connection refused";
  ConnectionRegistry offline(std::make_shared<MemoryKeyValueStore>(), std::make_shared<MemorySecretStore>(),
                             std::make_shared<ScriptedProber>(refused), ctx.logs.make_logger("connections"));
  AddConnectionResult unreachable;
  offline.connect_device(web, [&unreachable](const AddConnectionResult& r){ unreachable = r; });
  LANSHARE_CHECK(ctx, !unreachable.success);
  LANSHARE_CHECK(ctx, unreachable.error_kind == ErrorKind::Connectivity);
  LANSHARE_CHECK(ctx, offline.list().empty());
  return true;
}

bool test_reload_from_disk(TestContext& ctx) {
  TempWorkspace ws("connections");
  std::string id;
  {
    ConnectionRegistry registry(std::make_shared<FileKeyValueStore>(ws.path("data")),
                                std::make_shared<FileSecretStore>(ws.path("data/secrets")),
                                std::make_shared<ScriptedProber>(probe_ok()),
                                ctx.logs.make_logger("connections"));
    auto r = add_sync(registry, ftp_profile("nas.local", 21));
    LANSHARE_CHECK(ctx, r.success);
    id = r.profile.id;
  }
  ConnectionRegistry reopened(std::make_shared<FileKeyValueStore>(ws.path("data")),
                              std::make_shared<FileSecretStore>(ws.path("data/secrets")),
                              std::make_shared<ScriptedProber>(probe_ok()),
                              ctx.logs.make_logger("connections"));
  LANSHARE_CHECK(ctx, reopened.load() == 1);
  auto profile = reopened.get(id);
  LANSHARE_CHECK(ctx, profile.has_value());
  LANSHARE_CHECK(ctx, profile->host == "nas.local");
  LANSHARE_CHECK(ctx, profile->secret == "s3cret");
  return true;
}

bool test_secret_files_are_owner_only(TestContext& ctx) {
  TempWorkspace ws("secrets");
  FileSecretStore secrets(ws.path("data/secrets"));
  auto previous = ::umask(0);
  bool stored = secrets.put("conn-a", "first");
  bool replaced = secrets.put("conn-a", "second");
  ::umask(previous);
  LANSHARE_CHECK(ctx, stored && replaced);

  auto file = ws.path("data/secrets/conn-a.secret");
  auto perms = std::filesystem::status(file).permissions();
  LANSHARE_CHECK(ctx, perms == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
  LANSHARE_CHECK(ctx, !std::filesystem::exists(ws.path("data/secrets/conn-a.secret.tmp")));
  LANSHARE_CHECK(ctx, secrets.get("conn-a").value_or("") == "second");
  LANSHARE_CHECK(ctx, !secrets.put("../escape", "x"));
  return true;
}

bool test_ftp_probe_refused_port(TestContext& ctx) {
  IoThread io;
  EngineConfig config;
  config.connect_timeout = 2s;
  auto prober = std::make_shared<NetworkProber>(io.io(), config, ctx.logs.make_logger("probe"));
  ConnectionRegistry registry(std::make_shared<MemoryKeyValueStore>(), std::make_shared<MemorySecretStore>(),
                              prober, ctx.logs.make_logger("connections"));

  Waiter<AddConnectionResult> waiter;
  registry.add(ftp_profile("127.0.0.1", lanshare::test::unused_local_port()), waiter.callback());
  auto r = waiter.wait(10s);
  LANSHARE_CHECK(ctx, r.has_value());
  LANSHARE_CHECK(ctx, !r->success);
  LANSHARE_CHECK(ctx, r->error_kind == ErrorKind::Connectivity);
  LANSHARE_CHECK(ctx, registry.list().empty());
  return true;
}

bool test_ftp_probe_login(TestContext& ctx) {
  FakeFtpServer server("alice", "s3cret");
  auto port = server.start();
  IoThread io;
  EngineConfig config;
  config.connect_timeout = 2s;
  auto prober = std::make_shared<NetworkProber>(io.io(), config, ctx.logs.make_logger("probe"));
  ConnectionRegistry registry(std::make_shared<MemoryKeyValueStore>(), std::make_shared<MemorySecretStore>(),
                              prober, ctx.logs.make_logger("connections"));

  Waiter<AddConnectionResult> good;
  registry.add(ftp_profile("127.0.0.1", port), good.callback());
  auto ok = good.wait(10s);
  LANSHARE_CHECK(ctx, ok.has_value());
  LANSHARE_CHECK(ctx, ok->success);

  auto wrong = ftp_profile("127.0.0.1", port);
  wrong.secret = "nope";
  Waiter<AddConnectionResult> bad;
  registry.add(wrong, bad.callback());
  auto rejected = bad.wait(10s);
  LANSHARE_CHECK(ctx, rejected.has_value());
  LANSHARE_CHECK(ctx, !rejected->success);
  LANSHARE_CHECK(ctx, rejected->error_kind == ErrorKind::Protocol);

  auto tls = ftp_profile("127.0.0.1", port);
  tls.is_secure = true;
  Waiter<AddConnectionResult> secure;
  registry.add(tls, secure.callback());
  auto unsupported = secure.wait(10s);
  LANSHARE_CHECK(ctx, unsupported.has_value());
  LANSHARE_CHECK(ctx, unsupported->error_kind == ErrorKind::Protocol);
  LANSHARE_CHECK(ctx, registry.list().size() == 1);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"add_persists_profile_and_secret", test_add_persists_profile_and_secret},
    {"failed_probe_stores_nothing", test_failed_probe_stores_nothing},
    {"rejects_bad_input", test_rejects_bad_input},
    {"update_and_remove", test_update_and_remove},
    {"failed_update_keeps_secret", test_failed_update_keeps_secret},
    {"connect_discovered_device", test_connect_discovered_device},
    {"reload_from_disk", test_reload_from_disk},
    {"secret_files_are_owner_only", test_secret_files_are_owner_only},
    {"ftp_probe_refused_port", test_ftp_probe_refused_port},
    {"ftp_probe_login", test_ftp_probe_login},
  };
  return lanshare::test::run_test_cases("connection registry", tests, argc, argv);
}
