#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

class Logger;

struct FtpEndpoint {
  std::string host;
  uint16_t port = 21;
  std::string user;     // empty logs in as "anonymous"
  std::string secret;
};

struct FtpReply {
  int code = 0;
  std::string text;     // every line of the reply joined with '\n'
};

struct FtpResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  int last_code = 0;
  uint64_t bytes = 0;
  std::vector<std::string> names;   // NLST output
};

struct FtpTransferOptions {
  std::function<void(uint64_t transferred, uint64_t total)> on_progress;
  std::function<bool()> cancelled;
};

// Passive-mode FTP client. Every call opens its own control connection,
// logs in, runs one operation and sends QUIT.
class FtpClient {
public:
  using Completion = std::function<void(const FtpResult&)>;

  FtpClient(asio::io_context& io,
            std::chrono::milliseconds connect_timeout,
            std::chrono::milliseconds io_timeout,
            std::shared_ptr<Logger> logger = nullptr);

  // Connect, log in, disconnect.
  void probe(const FtpEndpoint& endpoint, Completion done);

  // Stores local_path under its own file name inside remote_dir (CWD first
  // when remote_dir is not empty).
  void upload(const FtpEndpoint& endpoint,
              const std::filesystem::path& local_path,
              const std::string& remote_dir,
              FtpTransferOptions options,
              Completion done);

  void download(const FtpEndpoint& endpoint,
                const std::string& remote_path,
                const std::filesystem::path& local_path,
                FtpTransferOptions options,
                Completion done);

  void list(const FtpEndpoint& endpoint, const std::string& remote_dir, Completion done);
  void make_directory(const FtpEndpoint& endpoint, const std::string& remote_dir, Completion done);

private:
  asio::io_context& io_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  std::shared_ptr<Logger> logger_;
};

// Port from a "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)" reply.
std::optional<uint16_t> parse_pasv_port(const std::string& reply_text);
