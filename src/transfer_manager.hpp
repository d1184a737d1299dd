#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine_config.hpp"
#include "errors.hpp"
#include "subscription.hpp"
#include "transfer_executor.hpp"

class FtpClient;
class HttpClient;
class Logger;

enum class TransferStatus { Pending, Uploading, Downloading, Paused, Completed, Failed, Cancelled };

const char* to_string(TransferStatus status);

struct TransferTask {
  std::string id;
  std::string file_name;
  std::filesystem::path file_path;      // local side
  std::string remote_path;
  TransferDirection type = TransferDirection::Upload;
  uint64_t total_bytes = 0;
  uint64_t transferred_bytes = 0;
  double speed = 0.0;                   // bytes per second
  TransferStatus status = TransferStatus::Pending;
  std::chrono::system_clock::time_point start_time{};
  std::optional<std::chrono::system_clock::time_point> end_time;
  std::string error_message;
  ErrorKind error_kind = ErrorKind::None;
  std::map<std::string, std::string> metadata;   // connectionId, connectionName, remotePath

  bool terminal() const;
  bool active() const;
  double progress() const;
  nlohmann::json to_json() const;
};

struct RemoteOpResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  std::vector<std::string> names;
};

class TransferManager {
public:
  using RemoteOpCallback = std::function<void(const RemoteOpResult&)>;

  TransferManager(asio::io_context& io, EngineConfig config, std::shared_ptr<Logger> logger = nullptr);
  ~TransferManager();

  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  // Replaces the executor used for a protocol (tests install fakes here).
  void set_executor(TransferProtocol protocol, std::shared_ptr<TransferExecutor> executor);

  TransferTask enqueue_upload(const Endpoint& endpoint,
                              const std::filesystem::path& local_path,
                              const std::string& remote_path = std::string());
  TransferTask enqueue_download(const Endpoint& endpoint,
                                const std::string& remote_path,
                                const std::filesystem::path& local_path);

  bool cancel(const std::string& task_id);
  bool pause(const std::string& task_id);
  bool resume(const std::string& task_id);
  std::size_t cancel_for_connection(const std::string& connection_id);

  std::optional<TransferTask> task(const std::string& task_id) const;
  std::vector<TransferTask> tasks() const;      // every non-terminal task
  std::vector<TransferTask> history() const;    // finished tasks, oldest first
  std::size_t active_count() const;
  std::size_t pending_count() const;
  double total_speed() const;

  void list_remote_files(const ConnectionProfile& profile, const std::string& path, RemoteOpCallback done);
  void make_remote_directory(const ConnectionProfile& profile, const std::string& path, RemoteOpCallback done);

  SubscriptionHandle on_transfer_progress(std::function<void(const TransferTask&)> listener);
  void remove_progress_listener(SubscriptionHandle handle);

  std::size_t concurrency_limit() const { return config_.concurrent_transfers; }

private:
  struct Entry {
    TransferTask task;
    TransferJob job;
    uint64_t run_id = 0;
    CancelFlag cancel_flag;
    std::chrono::steady_clock::time_point run_started{};
    uint64_t seq = 0;
  };

  struct Launch {
    std::shared_ptr<TransferExecutor> executor;
    TransferJob job;
    CancelFlag cancel_flag;
    uint64_t run_id = 0;
  };

  TransferTask enqueue(TransferDirection direction,
                       const Endpoint& endpoint,
                       const std::filesystem::path& local_path,
                       const std::string& remote_path);
  void dispatch_locked(std::vector<Launch>& launches, std::vector<TransferTask>& events);
  void launch(std::vector<Launch> launches);
  void on_progress(const std::string& task_id, uint64_t run_id, uint64_t transferred, uint64_t total);
  void on_finished(const std::string& task_id, uint64_t run_id, const ExecutorResult& result);
  void retire_locked(const std::string& task_id);
  void stop_run_locked(Entry& entry);
  std::string next_task_id();

  asio::io_context& io_;
  EngineConfig config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<FtpClient> ftp_;
  std::unique_ptr<HttpClient> http_;

  // Held across a state change and the delivery of its events, so a task's
  // events reach listeners in state order and none follow cancel() or pause().
  std::recursive_mutex delivery_m_;
  mutable std::mutex m_;
  std::map<TransferProtocol, std::shared_ptr<TransferExecutor>> executors_;
  std::unordered_map<std::string, Entry> entries_;
  std::deque<std::string> pending_;
  std::set<std::string> active_;
  std::deque<TransferTask> history_;
  uint64_t next_run_ = 0;
  uint64_t next_seq_ = 0;

  Subscribers<TransferTask> progress_;
};
