#include "command_line_parser.hpp"

#include <cctype>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

const std::vector<CommandHelp>& lanshare_commands() {
  static const std::vector<CommandHelp> commands = {
    {"serve",          "<root>",             "share a directory over HTTP until interrupted", 1},
    {"scan",           "",                   "probe the local subnet for reachable services", 0},
    {"share",          "<file> [file...]",   "mint a share link (multi-file when several)", 1},
    {"share-info",     "<id>",               "show a share record and its expiry", 1},
    {"fetch-share",    "<id> <dest>",        "copy a shared file locally", 2},
    {"cleanup-shares", "",                   "delete expired share records", 0},
    {"upload",         "<url> <file>",       "POST a file to a sharing server", 2},
    {"download",       "<url> <dest>",       "GET a file from a sharing server", 2},
    {"settings",       "",                   "print the effective settings", 0},
  };
  return commands;
}

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.size() < 2 || token[0] != '-') return false;
  if(token[1] == '-') return token.size() > 2;
  return std::isalpha(static_cast<unsigned char>(token[1])) != 0 || token[1] == '?';
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  auto lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::apply_option(const std::vector<std::string>& args,
                                     std::size_t& i,
                                     SettingsManager& settings) const {
  const std::string& token = args[i];
  bool long_form = token.rfind("--", 0) == 0;
  std::string name = token.substr(long_form ? 2 : 1);
  std::optional<std::string> inline_value;
  auto eq = name.find('=');
  if(long_form && eq != std::string::npos) {
    inline_value = name.substr(eq + 1);
    name = name.substr(0, eq);
  }

  auto key = settings.resolve_key(name);
  bool negated = false;
  if(!key && long_form && name.rfind("no-", 0) == 0) {
    key = settings.resolve_key(name.substr(3));
    negated = key && settings.is_bool_setting(*key);
    if(!negated) key.reset();
  }
  if(!key) {
    if(long_form) throw CommandLineError("Unknown option " + token);
    return false;
  }

  std::string value;
  if(negated) {
    if(inline_value) throw CommandLineError("Option " + token + " takes no value");
    value = "false";
  } else if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    bool next_is_literal = i + 1 < args.size() && is_bool_literal(args[i + 1]);
    value = next_is_literal ? args[++i] : std::string("true");
  } else {
    if(i + 1 >= args.size()) throw CommandLineError("Missing value for option " + token);
    value = args[++i];
  }

  std::string error;
  if(!settings.set_from_string(*key, value, error)) {
    throw CommandLineError("Invalid value for option " + token + ": " + error);
  }
  return true;
}

CommandLine CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  CommandLine line;
  bool options_done = false;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }
    // short tokens that match no alias ("-1", "-x") stay positional
    if(!options_done && looks_like_option(token) && apply_option(args, i, settings)) {
      continue;
    }
    if(line.command.empty()) {
      line.command = token;
    } else {
      line.args.push_back(token);
    }
  }
  return line;
}

const CommandHelp& CommandLineParser::check(const CommandLine& line) const {
  for(const auto& command : lanshare_commands()) {
    if(line.command != command.name) continue;
    if(line.args.size() < command.min_args) {
      throw CommandLineError(std::string("usage: ") + process_name_ + " " + command.name + " " + command.arguments);
    }
    return command;
  }
  throw CommandLineError("Unknown command '" + line.command + "'");
}

void CommandLineParser::usage(Logger& out) const {
  out.print("{} - LAN file sharing, discovery and transfers", process_name_);
  out.print("Usage: {} [options] <command> [args...]", process_name_);
  out.print("");
  out.print("Commands:");
  for(const auto& command : lanshare_commands()) {
    std::string head = std::string(command.name) + (command.arguments[0] ? " " : "") + command.arguments;
    out.print("  {:<28} {}", head, command.summary);
  }
  out.print("");
  out.print("Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string hint = type == "bool" ? "" : "<" + type + ">";

    std::ostringstream aliases;
    auto alias_list = entry.value("aliases", std::vector<std::string>{});
    for(std::size_t i = 0; i < alias_list.size(); ++i) {
      aliases << (i == 0 ? " (" : ", ") << "-" << alias_list[i];
      if(i + 1 == alias_list.size()) aliases << ")";
    }

    const auto& default_value = entry.at("default");
    std::string shown = default_value.is_string() ? default_value.get<std::string>() : default_value.dump();
    if(shown.empty()) shown = "none";
    out.print("  --{:<22} {:<10} {}{} [default: {}]",
              key, hint, entry.value("description", ""), aliases.str(), shown);
  }
  out.print("");
  out.print("Options given together with --save are written to .config/lanshare.json");
}
