#include "command_line_parser.hpp"
#include "engine_config.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using lanshare::test::TempWorkspace;
using lanshare::test::TestCase;
using lanshare::test::TestContext;

namespace {

CommandLine parse_args(SettingsManager& settings, std::vector<std::string> tokens) {
  tokens.insert(tokens.begin(), "lanshare");
  std::vector<char*> argv;
  for(auto& t : tokens) argv.push_back(t.data());
  CommandLineParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
}

bool test_defaults_map_to_engine_config(TestContext& ctx) {
  SettingsManager settings;
  auto config = EngineConfig::from_settings(settings, "/srv/work");
  LANSHARE_CHECK(ctx, config.concurrent_transfers == 3);
  LANSHARE_CHECK(ctx, config.probe_timeout == std::chrono::milliseconds(500));
  LANSHARE_CHECK(ctx, config.share_expiry == std::chrono::hours(24));
  LANSHARE_CHECK(ctx, config.ftp_retry_count == 3);
  LANSHARE_CHECK(ctx, config.server_port == 8080);
  LANSHARE_CHECK(ctx, config.max_upload_bytes == 1024ull * 1024ull * 1024ull);
  LANSHARE_CHECK(ctx, (config.candidate_ports == std::vector<uint16_t>{80, 8080, 21, 22, 443, 5000, 8000, 9000}));
  LANSHARE_CHECK(ctx, config.data_dir == std::filesystem::path("/srv/work") / ".lanshare");
  LANSHARE_CHECK(ctx, config.device_id.rfind("device_", 0) == 0);
  LANSHARE_CHECK(ctx, config.device_id.size() == 7 + 16);
  return true;
}

bool test_values_are_validated(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  LANSHARE_CHECK(ctx, !settings.set_from_string("server_port", "70000", error));
  LANSHARE_CHECK(ctx, !error.empty());
  LANSHARE_CHECK(ctx, !settings.set_from_string("concurrent_transfers", "0", error));
  LANSHARE_CHECK(ctx, !settings.set_from_string("verbose", "maybe", error));
  LANSHARE_CHECK(ctx, !settings.set_from_string("no_such_key", "1", error));
  LANSHARE_CHECK(ctx, settings.get<int>("server_port") == 8080);

  LANSHARE_CHECK(ctx, settings.set_from_string("ports", " 21, 8080,21,,99999 ", error));
  auto config = EngineConfig::from_settings(settings, "/tmp");
  LANSHARE_CHECK(ctx, (config.candidate_ports == std::vector<uint16_t>{21, 8080}));
  LANSHARE_CHECK(ctx, !settings.set_from_string("ports", "21,http", error));

  LANSHARE_CHECK(ctx, settings.set_from_string("expiry", "48", error));
  LANSHARE_CHECK(ctx, EngineConfig::from_settings(settings, "/tmp").share_expiry == std::chrono::hours(48));
  return true;
}

bool test_save_and_load(TestContext& ctx) {
  TempWorkspace ws("settings");
  auto path = ws.path(".config/lanshare.json");
  {
    SettingsManager settings;
    settings.set_settings_path(path);
    std::string error;
    LANSHARE_CHECK(ctx, settings.set_from_string("device_id", "kitchen", error));
    LANSHARE_CHECK(ctx, settings.set_from_string("help", "true", error));
    LANSHARE_CHECK(ctx, settings.save());
  }
  auto saved = nlohmann::json::parse(lanshare::test::read_file(path));
  LANSHARE_CHECK(ctx, saved["device_id"] == "kitchen");
  LANSHARE_CHECK(ctx, !saved.contains("help"));

  lanshare::test::write_config_before_start(ws.root(), "lanshare.json",
    {{"device_id", "hall"}, {"server_port", "not a number"}, {"history_limit", 5}});
  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  LANSHARE_CHECK(ctx, reloaded.load());
  LANSHARE_CHECK(ctx, reloaded.get<std::string>("device_id") == "hall");
  LANSHARE_CHECK(ctx, reloaded.get<int>("server_port") == 8080);
  LANSHARE_CHECK(ctx, reloaded.get<int>("history_limit") == 5);

  SettingsManager missing;
  missing.set_settings_path(ws.path("nope.json"));
  LANSHARE_CHECK(ctx, !missing.load());
  return true;
}

bool test_cli_options_and_command(TestContext& ctx) {
  SettingsManager settings;
  auto line = parse_args(settings, {"--port=9000", "-ct", "5", "--verbose", "share", "a.txt", "-1", "b.txt"});
  LANSHARE_CHECK(ctx, line.command == "share");
  LANSHARE_CHECK(ctx, (line.args == std::vector<std::string>{"a.txt", "-1", "b.txt"}));
  LANSHARE_CHECK(ctx, settings.get<int>("server_port") == 9000);
  LANSHARE_CHECK(ctx, settings.get<int>("concurrent_transfers") == 5);
  LANSHARE_CHECK(ctx, settings.get<bool>("verbose"));

  line = parse_args(settings, {"--no-verbose", "scan", "--", "--port"});
  LANSHARE_CHECK(ctx, !settings.get<bool>("verbose"));
  LANSHARE_CHECK(ctx, line.command == "scan");
  LANSHARE_CHECK(ctx, (line.args == std::vector<std::string>{"--port"}));

  line = parse_args(settings, {"-v", "off", "settings"});
  LANSHARE_CHECK(ctx, !settings.get<bool>("verbose"));
  LANSHARE_CHECK(ctx, line.command == "settings");

  line = parse_args(settings, {});
  LANSHARE_CHECK(ctx, line.command.empty());
  return true;
}

bool test_cli_errors(TestContext& ctx) {
  SettingsManager settings;
  auto rejects = [&settings](std::vector<std::string> tokens){
    try {
      parse_args(settings, std::move(tokens));
    } catch(const CommandLineError&) {
      return true;
    }
    return false;
  };
  LANSHARE_CHECK(ctx, rejects({"--bogus", "scan"}));
  LANSHARE_CHECK(ctx, rejects({"scan", "--port"}));
  LANSHARE_CHECK(ctx, rejects({"--port", "abc"}));
  LANSHARE_CHECK(ctx, rejects({"--no-port"}));
  LANSHARE_CHECK(ctx, rejects({"--no-verbose=1"}));

  CommandLineParser parser;
  CommandLine line{"fetch-share", {"only-id"}};
  bool short_args = false;
  try {
    parser.check(line);
  } catch(const CommandLineError& e) {
    short_args = std::string(e.what()).find("fetch-share <id> <dest>") != std::string::npos;
  }
  LANSHARE_CHECK(ctx, short_args);

  bool unknown = false;
  try {
    parser.check(CommandLine{"launch", {}});
  } catch(const CommandLineError&) {
    unknown = true;
  }
  LANSHARE_CHECK(ctx, unknown);

  line.args.push_back("/tmp/dest");
  LANSHARE_CHECK(ctx, std::string(parser.check(line).name) == "fetch-share");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults_map_to_engine_config", test_defaults_map_to_engine_config},
    {"values_are_validated", test_values_are_validated},
    {"save_and_load", test_save_and_load},
    {"cli_options_and_command", test_cli_options_and_command},
    {"cli_errors", test_cli_errors},
  };
  return lanshare::test::run_test_cases("settings", tests, argc, argv);
}
