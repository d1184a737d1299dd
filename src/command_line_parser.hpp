#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class Logger;

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CommandLine {
  std::string command;              // first positional token, empty when absent
  std::vector<std::string> args;    // remaining positional tokens in order
};

struct CommandHelp {
  const char* name;
  const char* arguments;
  const char* summary;
  std::size_t min_args;
};

// Subcommands understood by the lanshare executable.
const std::vector<CommandHelp>& lanshare_commands();

// Splits argv into settings options and a subcommand with its arguments.
// Options: --key value, --key=value, -alias value, --flag, --no-flag.
// A bare "--" ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "lanshare",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Throws CommandLineError on unknown options or values the setting rejects.
  CommandLine parse(int argc, char* argv[], SettingsManager& settings) const;

  // Throws CommandLineError when command is unknown or short of arguments.
  const CommandHelp& check(const CommandLine& line) const;

  void usage(Logger& out) const;

private:
  bool apply_option(const std::vector<std::string>& args,
                    std::size_t& i,
                    SettingsManager& settings) const;
  static bool looks_like_option(const std::string& token);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
