#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "connection_profile.hpp"
#include "errors.hpp"

class FtpClient;
class HttpClient;
class Logger;
struct DiscoveredDevice;

enum class TransferDirection { Upload, Download };

const char* to_string(TransferDirection direction);

// Remote side of a transfer: a saved connection or a discovered peer.
struct Endpoint {
  std::string connection_id;      // empty for discovered peers
  std::string connection_name;
  TransferProtocol protocol = TransferProtocol::Http;
  std::string host;
  uint16_t port = 0;
  std::string user;
  std::string secret;
  std::map<std::string, std::string> headers;
  std::string remote_path;        // default remote directory / path prefix
  bool is_secure = false;

  static Endpoint from_profile(const ConnectionProfile& profile);
  static Endpoint from_device(const DiscoveredDevice& device);

  std::string base_url() const;
};

struct TransferJob {
  std::string task_id;
  TransferDirection direction = TransferDirection::Upload;
  Endpoint endpoint;
  std::filesystem::path local_path;
  std::string remote_path;
};

struct ExecutorResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  uint64_t bytes = 0;
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

// Moves one file for one protocol. start() must return without blocking;
// progress and done are called later from the I/O thread.
class TransferExecutor {
public:
  using Progress = std::function<void(uint64_t transferred, uint64_t total)>;
  using Completion = std::function<void(const ExecutorResult&)>;

  virtual ~TransferExecutor() = default;

  virtual bool supports(TransferDirection direction) const = 0;
  virtual std::string unsupported_reason() const { return std::string(); }

  virtual void start(const TransferJob& job,
                     CancelFlag cancel,
                     Progress progress,
                     Completion done) = 0;
};

// Retries connectivity failures up to retry_count attempts in total.
class FtpTransferExecutor : public TransferExecutor {
public:
  FtpTransferExecutor(FtpClient& client, std::size_t retry_count, std::shared_ptr<Logger> logger = nullptr);

  bool supports(TransferDirection) const override { return true; }
  void start(const TransferJob& job, CancelFlag cancel, Progress progress, Completion done) override;

private:
  void attempt(TransferJob job, CancelFlag cancel, Progress progress, Completion done, std::size_t number);

  FtpClient& client_;
  std::size_t retry_count_;
  std::shared_ptr<Logger> logger_;
};

// Multipart POST for uploads, streamed GET for downloads.
class HttpTransferExecutor : public TransferExecutor {
public:
  explicit HttpTransferExecutor(HttpClient& client);

  bool supports(TransferDirection) const override { return true; }
  void start(const TransferJob& job, CancelFlag cancel, Progress progress, Completion done) override;

  static std::string upload_url(const TransferJob& job);
  static std::string download_url(const TransferJob& job);

private:
  HttpClient& client_;
};

// Explicit "not supported" for protocols without a wire implementation.
class UnsupportedTransferExecutor : public TransferExecutor {
public:
  UnsupportedTransferExecutor(asio::io_context& io, std::string reason)
    : io_(io), reason_(std::move(reason)) {}

  bool supports(TransferDirection) const override { return false; }
  std::string unsupported_reason() const override { return reason_; }
  void start(const TransferJob& job, CancelFlag cancel, Progress progress, Completion done) override;

private:
  asio::io_context& io_;
  std::string reason_;
};
