#include "connection_registry.hpp"
#include "errors.hpp"
#include "fake_ftp_server.hpp"
#include "ftp_client.hpp"
#include "http_client.hpp"
#include "net_address.hpp"
#include "settings_manager.hpp"
#include "share_registry.hpp"
#include "sharing_engine.hpp"
#include "sharing_server.hpp"
#include "test_runner_utils.hpp"
#include "transfer_manager.hpp"

#include <algorithm>
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

FtpEndpoint ftp_endpoint(uint16_t port, const std::string& secret = "s3cret") {
  return FtpEndpoint{"127.0.0.1", port, "alice", secret};
}

EngineConfig client_config() {
  EngineConfig config;
  config.connect_timeout = 2s;
  config.io_timeout = 5s;
  config.server_bind_address = "127.0.0.1";
  config.server_port = 0;
  return config;
}

// Waits until the task leaves the queue and returns its final state.
std::optional<TransferTask> wait_terminal(TransferManager& manager, const std::string& id,
                                          std::chrono::milliseconds timeout = 15s) {
  bool done = lanshare::test::wait_for_condition([&]{
    auto t = manager.task(id);
    return t && t->terminal();
  }, timeout);
  if(!done) return std::nullopt;
  return manager.task(id);
}

bool test_ftp_client_operations(TestContext& ctx) {
  FakeFtpServer server("alice", "s3cret");
  auto port = server.start();
  TempWorkspace ws("ftp_client");
  IoThread io;
  auto config = client_config();
  FtpClient client(io.io(), config.connect_timeout, config.io_timeout, ctx.logs.make_logger("ftp"));

  Waiter<FtpResult> mkdir;
  client.make_directory(ftp_endpoint(port), "/inbox", mkdir.callback());
  auto made = mkdir.wait(10s);
  LANSHARE_CHECK(ctx, made && made->success);
  LANSHARE_CHECK(ctx, server.has_dir("/inbox"));

  auto local = ws.write_file("notes.txt", std::string(5000, 'n'));
  std::vector<uint64_t> progress;
  FtpTransferOptions options;
  options.on_progress = [&progress](uint64_t transferred, uint64_t){ progress.push_back(transferred); };
  Waiter<FtpResult> upload;
  client.upload(ftp_endpoint(port), local, "/inbox", options, upload.callback());
  auto stored = upload.wait(10s);
  LANSHARE_CHECK(ctx, stored && stored->success);
  LANSHARE_CHECK(ctx, stored->bytes == 5000);
  LANSHARE_CHECK(ctx, server.file("/inbox/notes.txt").value_or("") == std::string(5000, 'n'));
  LANSHARE_CHECK(ctx, !progress.empty());
  LANSHARE_CHECK(ctx, progress.back() == 5000);

  Waiter<FtpResult> listing;
  client.list(ftp_endpoint(port), "/inbox", listing.callback());
  auto names = listing.wait(10s);
  LANSHARE_CHECK(ctx, names && names->success);
  LANSHARE_CHECK(ctx, names->names == std::vector<std::string>{"notes.txt"});

  Waiter<FtpResult> download;
  client.download(ftp_endpoint(port), "/inbox/notes.txt", ws.path("back.txt"), FtpTransferOptions{}, download.callback());
  auto fetched = download.wait(10s);
  LANSHARE_CHECK(ctx, fetched && fetched->success);
  LANSHARE_CHECK(ctx, lanshare::test::read_file(ws.path("back.txt")) == std::string(5000, 'n'));

  Waiter<FtpResult> missing;
  client.download(ftp_endpoint(port), "/inbox/none.txt", ws.path("none.txt"), FtpTransferOptions{}, missing.callback());
  auto refused = missing.wait(10s);
  LANSHARE_CHECK(ctx, refused && !refused->success);
  LANSHARE_CHECK(ctx, refused->error_kind == ErrorKind::Protocol);

  Waiter<FtpResult> no_dir;
  client.upload(ftp_endpoint(port), local, "/nowhere", FtpTransferOptions{}, no_dir.callback());
  auto cwd = no_dir.wait(10s);
  LANSHARE_CHECK(ctx, cwd && !cwd->success);
  LANSHARE_CHECK(ctx, cwd->error_kind == ErrorKind::Protocol);

  Waiter<FtpResult> login;
  client.probe(ftp_endpoint(port, "wrong"), login.callback());
  auto rejected = login.wait(10s);
  LANSHARE_CHECK(ctx, rejected && !rejected->success);
  LANSHARE_CHECK(ctx, rejected->error_kind == ErrorKind::Protocol);
  return true;
}

bool test_ftp_transfer_retries(TestContext& ctx) {
  FakeFtpServer server("alice", "s3cret");
  auto port = server.start();
  TempWorkspace ws("ftp_retry");
  IoThread io;
  auto config = client_config();
  config.ftp_retry_count = 3;
  TransferManager manager(io.io(), config, ctx.logs.make_logger("transfers"));

  Endpoint endpoint;
  endpoint.connection_id = "conn-ftp";
  endpoint.protocol = TransferProtocol::Ftp;
  endpoint.host = "127.0.0.1";
  endpoint.port = port;
  endpoint.user = "alice";
  endpoint.secret = "s3cret";

  auto file = ws.write_file("flaky.bin", "payload");
  server.drop_next_connections(2);
  auto task = manager.enqueue_upload(endpoint, file, "/");
  auto done = wait_terminal(manager, task.id);
  LANSHARE_CHECK(ctx, done.has_value());
  LANSHARE_CHECK(ctx, done->status == TransferStatus::Completed);
  LANSHARE_CHECK(ctx, server.connections_seen() == 3);
  LANSHARE_CHECK(ctx, server.file("/flaky.bin").value_or("") == "payload");
  LANSHARE_CHECK(ctx, ctx.logs.contains("retrying"));

  server.drop_next_connections(3);
  auto doomed = manager.enqueue_upload(endpoint, file, "/");
  auto failed = wait_terminal(manager, doomed.id);
  LANSHARE_CHECK(ctx, failed.has_value());
  LANSHARE_CHECK(ctx, failed->status == TransferStatus::Failed);
  LANSHARE_CHECK(ctx, failed->error_kind == ErrorKind::Connectivity);
  LANSHARE_CHECK(ctx, server.connections_seen() == 6);

  auto pull = manager.enqueue_download(endpoint, "/flaky.bin", ws.path("pulled.bin"));
  auto pulled = wait_terminal(manager, pull.id);
  LANSHARE_CHECK(ctx, pulled && pulled->status == TransferStatus::Completed);
  LANSHARE_CHECK(ctx, pulled->total_bytes == 7);
  LANSHARE_CHECK(ctx, lanshare::test::read_file(ws.path("pulled.bin")) == "payload");

  ConnectionProfile profile;
  profile.host = "127.0.0.1";
  profile.port = port;
  profile.protocol = TransferProtocol::Ftp;
  profile.user = "alice";
  profile.secret = "s3cret";
  Waiter<RemoteOpResult> mkdir;
  manager.make_remote_directory(profile, "/made", mkdir.callback());
  auto made = mkdir.wait(10s);
  LANSHARE_CHECK(ctx, made && made->success);
  LANSHARE_CHECK(ctx, server.has_dir("/made"));

  Waiter<RemoteOpResult> listing;
  manager.list_remote_files(profile, "/", listing.callback());
  auto names = listing.wait(10s);
  LANSHARE_CHECK(ctx, names && names->success);
  LANSHARE_CHECK(ctx, std::find(names->names.begin(), names->names.end(), "flaky.bin") != names->names.end());
  return true;
}

bool test_http_transfers_against_local_server(TestContext& ctx) {
  TempWorkspace ws("http_transfers");
  auto root = ws.mkdir("root");
  ws.write_file("root/served.txt", "served over http");
  IoThread io;
  auto config = client_config();
  LocalSharingServer server(io.io(), config, std::make_shared<FixedAddressResolver>("127.0.0.1"),
                            ctx.logs.make_logger("sharing-server"));
  auto port = server.start(root).port;
  TransferManager manager(io.io(), config, ctx.logs.make_logger("transfers"));

  Endpoint endpoint;
  endpoint.connection_name = "peer";
  endpoint.protocol = TransferProtocol::Http;
  endpoint.host = "127.0.0.1";
  endpoint.port = port;

  auto local = ws.write_file("outgoing/photo.jpg", std::string(120000, 'p'));
  auto up = manager.enqueue_upload(endpoint, local);
  auto uploaded = wait_terminal(manager, up.id);
  LANSHARE_CHECK(ctx, uploaded && uploaded->status == TransferStatus::Completed);
  LANSHARE_CHECK(ctx, uploaded->transferred_bytes == 120000);
  LANSHARE_CHECK(ctx, lanshare::test::read_file(root / "photo.jpg") == std::string(120000, 'p'));

  auto down = manager.enqueue_download(endpoint, "/served.txt", ws.path("incoming/served.txt"));
  auto downloaded = wait_terminal(manager, down.id);
  LANSHARE_CHECK(ctx, downloaded && downloaded->status == TransferStatus::Completed);
  LANSHARE_CHECK(ctx, downloaded->total_bytes == 16);
  LANSHARE_CHECK(ctx, lanshare::test::read_file(ws.path("incoming/served.txt")) == "served over http");

  auto missing = manager.enqueue_download(endpoint, "/absent.txt", ws.path("absent.txt"));
  auto failed = wait_terminal(manager, missing.id);
  LANSHARE_CHECK(ctx, failed && failed->status == TransferStatus::Failed);
  LANSHARE_CHECK(ctx, failed->error_kind == ErrorKind::Protocol);
  LANSHARE_CHECK(ctx, failed->error_message.find("404") != std::string::npos);

  HttpClient client(io.io(), config.connect_timeout, config.io_timeout, ctx.logs.make_logger("http"));
  auto base = "http://127.0.0.1:" + std::to_string(port);
  Waiter<HttpResult> head;
  client.head(base + "/served.txt", HttpCallOptions{}, head.callback());
  auto h = head.wait(10s);
  LANSHARE_CHECK(ctx, h && h->success);
  LANSHARE_CHECK(ctx, h->status == 200);
  LANSHARE_CHECK(ctx, h->body.empty());

  Waiter<HttpResult> get;
  client.get(base + "/?format=json", HttpCallOptions{}, get.callback());
  auto listing = get.wait(10s);
  LANSHARE_CHECK(ctx, listing && listing->success);
  LANSHARE_CHECK(ctx, listing->body.find("photo.jpg") != std::string::npos);
  LANSHARE_CHECK(ctx, listing->body.find("served.txt") != std::string::npos);

  Waiter<HttpResult> refused;
  client.get("http://127.0.0.1:" + std::to_string(lanshare::test::unused_local_port()) + "/",
             HttpCallOptions{}, refused.callback());
  auto r = refused.wait(10s);
  LANSHARE_CHECK(ctx, r && !r->success);
  LANSHARE_CHECK(ctx, r->error_kind == ErrorKind::Connectivity);

  server.stop();
  return true;
}

bool test_engine_end_to_end(TestContext& ctx) {
  FakeFtpServer ftp("alice", "s3cret");
  auto ftp_port = ftp.start();
  TempWorkspace ws("engine");
  auto root = ws.mkdir("shared");
  auto file = ws.write_file("shared/movie.mp4", std::string(3000, 'm'));

  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  LANSHARE_CHECK(ctx, settings->set_from_string("server_bind_address", "127.0.0.1", error));
  LANSHARE_CHECK(ctx, settings->set_from_string("server_port", "0", error));
  LANSHARE_CHECK(ctx, settings->set_from_string("local_ip", "127.0.0.1", error));
  LANSHARE_CHECK(ctx, settings->set_from_string("device_id", "engine_test", error));
  LANSHARE_CHECK(ctx, settings->set_from_string("connect_timeout_ms", "2000", error));

  SharingEngine::Options options;
  options.workspace_root = ws.root();
  SharingEngine engine(settings, options);
  engine.start_background();

  auto state = engine.server().start(root);
  LANSHARE_CHECK(ctx, state.is_running());
  auto link = engine.shares().generate_shareable_link(file);
  LANSHARE_CHECK(ctx, link.url == "https://127.0.0.1/file/" + link.share_id);
  auto response = lanshare::test::http_get(state.port, "/file/" + link.share_id);
  LANSHARE_CHECK(ctx, response.status == 200);
  LANSHARE_CHECK(ctx, response.body == std::string(3000, 'm'));
  LANSHARE_CHECK(ctx, engine.shares().get_share_info(link.share_id).record.download_count == 1);

  ConnectionProfile profile;
  profile.name = "nas";
  profile.host = "127.0.0.1";
  profile.port = ftp_port;
  profile.protocol = TransferProtocol::Ftp;
  profile.user = "alice";
  profile.secret = "s3cret";
  Waiter<AddConnectionResult> added;
  engine.connections().add(profile, added.callback());
  auto r = added.wait(10s);
  LANSHARE_CHECK(ctx, r && r->success);

  auto task = engine.upload_to(r->profile.id, file, "/");
  auto done = wait_terminal(engine.transfers(), task.id);
  LANSHARE_CHECK(ctx, done && done->status == TransferStatus::Completed);
  LANSHARE_CHECK(ctx, ftp.file("/movie.mp4").value_or("") == std::string(3000, 'm'));
  LANSHARE_CHECK(ctx, done->metadata["connectionName"] == "nas");

  bool threw = false;
  try {
    engine.upload_to("conn-missing", file);
  } catch(const NotFoundError&) {
    threw = true;
  }
  LANSHARE_CHECK(ctx, threw);

  engine.connections().remove(r->profile.id);
  LANSHARE_CHECK(ctx, engine.connections().list().empty());

  engine.stop();
  LANSHARE_CHECK(ctx, !engine.server().state().is_running());
  engine.stop();

  bool restarted = true;
  try {
    engine.start_background();
  } catch(const std::logic_error&) {
    restarted = false;
  }
  LANSHARE_CHECK(ctx, !restarted);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"ftp_client_operations", test_ftp_client_operations},
    {"ftp_transfer_retries", test_ftp_transfer_retries},
    {"http_transfers_against_local_server", test_http_transfers_against_local_server},
    {"engine_end_to_end", test_engine_end_to_end},
  };
  return lanshare::test::run_test_cases("protocol client", tests, argc, argv);
}
