#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "command_line_parser.hpp"
#include "discovery.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "share_registry.hpp"
#include "sharing_engine.hpp"
#include "sharing_server.hpp"
#include "transfer_manager.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::minutes kScanWaitLimit{10};

int cmd_serve(SharingEngine& engine, const std::string& root) {
  auto state = engine.server().start(root);
  engine.logger()->print("Serving {} at {}", state.root_path.string(), state.server_url);

  asio::signal_set signals(engine.io(), SIGINT, SIGTERM);
  signals.async_wait([&engine](std::error_code ec, int){
    if(ec) return;
    engine.server().stop();
    engine.io().stop();
  });
  engine.run();
  return 0;
}

int cmd_scan(SharingEngine& engine) {
  auto out = engine.logger();
  engine.start_background();
  auto handle = engine.discovery().on_discovered([out](const DiscoveredDevice& device){
    out->print("  {:<21} {:<6} {}", device.id, to_string(device.service), device.name);
  });
  auto scan = engine.discovery().discover();
  out->print("Scanning {}.0/24 ...", scan->subnet().empty() ? std::string("?") : scan->subnet());
  if(!scan->wait(kScanWaitLimit)) {
    scan->cancel();
  }
  engine.discovery().remove_discovered_listener(handle);
  out->print("{} device(s) found", scan->devices().size());
  return 0;
}

int cmd_share(SharingEngine& engine, const std::vector<std::string>& files) {
  auto out = engine.logger();
  ShareLink link;
  if(files.size() == 1) {
    link = engine.shares().generate_shareable_link(files.front());
  } else {
    std::vector<fs::path> paths(files.begin(), files.end());
    link = engine.shares().generate_multi_file_link(paths);
  }
  out->print("Share id: {}", link.share_id);
  out->print("URL:      {}", link.url);
  out->print("QR:       {}", engine.shares().generate_qr_code(link.url).to_json().dump());
  return 0;
}

// Runs one transfer to completion and reports progress on the way.
int run_transfer(SharingEngine& engine, const std::function<TransferTask()>& enqueue) {
  auto out = engine.logger();
  engine.start_background();

  std::mutex m;
  std::condition_variable cv;
  std::optional<TransferTask> finished;
  auto last_print = std::chrono::steady_clock::now();
  auto handle = engine.transfers().on_transfer_progress([&](const TransferTask& task){
    std::lock_guard lg(m);
    if(task.terminal()) {
      finished = task;
      cv.notify_all();
      return;
    }
    auto now = std::chrono::steady_clock::now();
    if(now - last_print > std::chrono::milliseconds(500)) {
      last_print = now;
      out->print("  {} {:.1f}% ({:.0f} B/s)", task.file_name, task.progress() * 100.0, task.speed);
    }
  });

  auto task = enqueue();
  {
    std::unique_lock lk(m);
    if(task.terminal()) finished = task;
    cv.wait(lk, [&]{ return finished.has_value(); });
  }
  engine.transfers().remove_progress_listener(handle);

  if(finished->status == TransferStatus::Completed) {
    out->print("{} {} complete ({} bytes)", to_string(finished->type), finished->file_name, finished->total_bytes);
    return 0;
  }
  out->print_err("{} {} failed ({}): {}", to_string(finished->type), finished->file_name,
                 ::to_string(finished->error_kind), finished->error_message);
  return 1;
}

std::optional<Endpoint> endpoint_for_url(const std::string& text, std::string& remote_path) {
  auto url = parse_url(text);
  if(!url) return std::nullopt;
  Endpoint endpoint;
  endpoint.protocol = url->secure() ? TransferProtocol::Https : TransferProtocol::Http;
  endpoint.is_secure = url->secure();
  endpoint.host = url->host;
  endpoint.port = url->port;
  endpoint.connection_name = url->host;
  auto query = url->target.find('?');
  remote_path = url_decode(url->target.substr(0, query), false);
  return endpoint;
}

} // namespace

int main(int argc, char** argv){
  try {
    SharingEngine::Options options;
    options.workspace_root = fs::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "lanshare.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? fs::path(argv[0]).filename().string() : "lanshare");
    CommandLine line;
    try {
      line = parser.parse(argc, argv, *settings);
      if(!settings->help_requested() && !line.command.empty()) parser.check(line);
    } catch(const CommandLineError& e) {
      Logger cli("cli");
      cli.print_err("{}", e.what());
      return 1;
    }
    if(settings->help_requested() || line.command.empty()) {
      Logger cli("cli");
      parser.usage(cli);
      return settings->help_requested() ? 0 : 1;
    }

    SharingEngine engine(settings, options);
    engine.start();
    auto out = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        out->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    const auto& command = line.command;
    const auto& args = line.args;
    int rc = 0;
    if(command == "serve") {
      rc = cmd_serve(engine, args[0]);
    } else if(command == "scan") {
      rc = cmd_scan(engine);
    } else if(command == "share") {
      rc = cmd_share(engine, args);
    } else if(command == "share-info") {
      out->print("{}", engine.shares().get_share_info(args[0]).to_json().dump(2));
    } else if(command == "fetch-share") {
      for(const auto& path : engine.shares().download_shared_file(args[0], args[1])) {
        out->print("Wrote {}", path.string());
      }
    } else if(command == "cleanup-shares") {
      out->print("Removed {} expired share(s)", engine.shares().cleanup_expired_shares());
    } else if(command == "upload" || command == "download") {
      bool upload = command == "upload";
      std::string remote;
      auto endpoint = endpoint_for_url(args[0], remote);
      if(!endpoint) {
        out->print_err("Not an http(s) URL: {}", args[0]);
        rc = 1;
      } else {
        rc = run_transfer(engine, [&]{
          return upload ? engine.transfers().enqueue_upload(*endpoint, args[1], remote == "/" ? std::string() : remote)
                        : engine.transfers().enqueue_download(*endpoint, remote, args[1]);
        });
      }
    } else if(command == "settings") {
      out->print("{}", settings->get_json(false).dump(2));
    }

    engine.stop();
    return rc;
  } catch(std::exception& e) {
    init(false);
    Logger logger("lanshare");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
