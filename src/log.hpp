#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Creates the shared sinks. An empty log_file keeps console output only.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

struct LogRecord {
  std::string tag;      // logger name, e.g. "transfers"
  spdlog::level::level_enum level = spdlog::level::info;
  std::string message;
};

// Writes to the shared spdlog sinks unless passthrough is off.
void emit_log_record(const LogRecord& record);

// Named log channel. Every component owns one; listeners see each line
// before it reaches the spdlog sinks and may swallow it by returning true.
class Logger {
public:
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger();
  explicit Logger(std::string tag);

  void set_tag(std::string tag);
  const std::string& tag() const { return tag_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  // Plain user-facing output (CLI results); no timestamp or level.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit_plain(fmt::format(fmt, std::forward<Args>(args)...), false);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit_plain(fmt::format(fmt, std::forward<Args>(args)...), true);
  }

private:
  template<typename... Args>
  void log(spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    LogRecord record{tag_, level, fmt::format(fmt, std::forward<Args>(args)...)};
    if(dispatch(record)) return;
    emit_log_record(record);
  }

  bool dispatch(const LogRecord& record);
  void emit_plain(const std::string& message, bool to_stderr);

  std::string tag_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Logging for code paths that may not have a component logger yet.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->info(fmt, std::forward<Args>(args)...);
  } else {
    emit_log_record({"", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    emit_log_record({"", spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else {
    emit_log_record({"", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}
