#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace lanshare::test {

inline void write_config_before_start(const std::filesystem::path& workspace,
                                      const std::string& filename,
                                      const nlohmann::json& content) {
  auto config_dir = workspace / ".config";
  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  std::ofstream out(config_dir / filename, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

// Fresh directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    root_ = std::filesystem::temp_directory_path() / ("lanshare_" + name + "_" + random_hex(4));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path path(const std::string& rel) const { return root_ / rel; }

  std::filesystem::path write_file(const std::string& rel, const std::string& content) const {
    auto p = root_ / rel;
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    return p;
  }

  std::filesystem::path mkdir(const std::string& rel) const {
    auto p = root_ / rel;
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
    return p;
  }

private:
  std::filesystem::path root_;
};

inline std::string read_file(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if(!in) return std::string();
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// io_context driven by one background thread for the lifetime of the object.
class IoThread {
public:
  IoThread() : work_(asio::make_work_guard(io_)) {
    thread_ = std::thread([this](){ io_.run(); });
  }

  ~IoThread() {
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  IoThread(const IoThread&) = delete;
  IoThread& operator=(const IoThread&) = delete;

  asio::io_context& io() { return io_; }

  // Runs fn on the io thread and waits for it.
  template<typename Fn>
  void run_sync(Fn fn) {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    asio::post(io_, [&](){
      fn();
      std::lock_guard<std::mutex> lock(m);
      done = true;
      cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, [&]{ return done; });
  }

private:
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread thread_;
};

// One-shot value handed from a completion handler to the test thread.
template<typename T>
class Waiter {
public:
  void set(T value) {
    std::lock_guard<std::mutex> lock(m_);
    value_ = std::move(value);
    cv_.notify_all();
  }

  std::function<void(T)> callback() {
    return [this](T value){ set(std::move(value)); };
  }

  std::optional<T> wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, timeout, [this]{ return value_.has_value(); });
    return value_;
  }

private:
  std::mutex m_;
  std::condition_variable cv_;
  std::optional<T> value_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener([this, label](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + record.message);
      } else {
        lines_.emplace_back(record.tag + ": " + record.message);
      }
      cv_.notify_all();
      return false;
    });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Fresh logger already attached; components under test take it.
  std::shared_ptr<Logger> make_logger(const std::string& tag) {
    auto logger = std::make_shared<Logger>(tag);
    attach(logger);
    return logger;
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void note(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// A port on 127.0.0.1 that nothing listens on (bound, then released).
inline uint16_t unused_local_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();
  acceptor.close();
  return port;
}

struct RawResponse {
  int status = 0;
  std::string head;
  std::string body;

  // Case-insensitive header lookup on the raw head.
  std::string header(const std::string& name) const {
    std::istringstream in(head);
    std::string line;
    auto want = to_lower(name);
    while(std::getline(in, line)) {
      if(!line.empty() && line.back() == '\r') line.pop_back();
      auto colon = line.find(':');
      if(colon == std::string::npos) continue;
      if(to_lower(trim_copy(line.substr(0, colon))) == want) {
        return trim_copy(line.substr(colon + 1));
      }
    }
    return std::string();
  }
};

// Sends bytes verbatim to 127.0.0.1:port and reads until the peer closes.
inline RawResponse raw_http(uint16_t port, const std::string& request) {
  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  asio::write(socket, asio::buffer(request));

  std::string data;
  std::error_code ec;
  std::array<char, 8192> buf;
  for(;;) {
    auto n = socket.read_some(asio::buffer(buf), ec);
    data.append(buf.data(), n);
    if(ec) break;
  }

  RawResponse response;
  auto end = data.find("\r\n\r\n");
  if(end == std::string::npos) return response;
  response.head = data.substr(0, end);
  response.body = data.substr(end + 4);
  auto space = response.head.find(' ');
  if(space != std::string::npos) {
    response.status = std::atoi(response.head.c_str() + space + 1);
  }
  return response;
}

inline RawResponse http_get(uint16_t port, const std::string& target,
                            const std::string& extra_headers = std::string()) {
  return raw_http(port, "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\n" + extra_headers +
                        "Connection: close\r\n\r\n");
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

#define LANSHARE_CHECK(ctx, cond) \
  do { \
    if(!(cond)) { \
      (ctx).logs.note(std::string("check failed: " #cond " at line ") + std::to_string(__LINE__)); \
      return false; \
    } \
  } while(0)

inline int run_test_cases(const std::string& suite, const std::vector<TestCase>& tests,
                          int argc, char** argv) {
  bool verbose = (std::getenv("LANSHARE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("LANSHARE_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace lanshare::test
