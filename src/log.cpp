#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::mutex g_sink_mutex;
std::shared_ptr<spdlog::logger> g_event_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kEventPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void create_loggers_locked() {
  if(g_event_logger) return;

  auto event_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  event_sink->set_pattern(kEventPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kEventPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_event_logger = std::make_shared<spdlog::logger>("lanshare.events", std::move(event_sink));
  g_error_logger = std::make_shared<spdlog::logger>("lanshare.errors", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("lanshare.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("lanshare.print_err", std::move(plain_err_sink));

  g_event_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();
}

} // namespace

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();

  if(!log_file.empty()) {
    try {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
      file_sink->set_pattern(kEventPattern);
      g_event_logger->sinks().push_back(file_sink);
      g_error_logger->sinks().push_back(file_sink);
    } catch(const spdlog::spdlog_ex& e) {
      g_error_logger->error("Unable to open log file {}: {}", log_file, e.what());
    }
  }

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_event_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::warn);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void emit_log_record(const LogRecord& record) {
  if(!log_passthrough()) return;
  ensure_loggers();

  // warnings and errors go to stderr so CLI output stays clean
  spdlog::logger* sink = record.level >= spdlog::level::warn
    ? g_error_logger.get()
    : g_event_logger.get();
  if(record.tag.empty()) {
    sink->log(record.level, record.message);
  } else {
    sink->log(record.level, fmt::format("[{}] {}", record.tag, record.message));
  }
}

Logger::Logger() = default;
Logger::Logger(std::string tag) : tag_(std::move(tag)) {}

void Logger::set_tag(std::string tag) {
  tag_ = std::move(tag);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(record)) handled = true;
    } catch(const std::exception& e) {
      emit_log_record({tag_, spdlog::level::warn, fmt::format("log listener threw: {}", e.what())});
    }
  }
  return handled;
}

void Logger::emit_plain(const std::string& message, bool to_stderr) {
  if(!log_passthrough()) return;
  ensure_loggers();
  auto* sink = to_stderr ? g_print_err_logger.get() : g_print_logger.get();
  sink->info(message);
}
