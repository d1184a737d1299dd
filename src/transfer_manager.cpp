#include "transfer_manager.hpp"

#include <algorithm>

#include "ftp_client.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::Uploading: return "uploading";
    case TransferStatus::Downloading: return "downloading";
    case TransferStatus::Paused: return "paused";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

bool TransferTask::terminal() const {
  return status == TransferStatus::Completed
      || status == TransferStatus::Failed
      || status == TransferStatus::Cancelled;
}

bool TransferTask::active() const {
  return status == TransferStatus::Uploading || status == TransferStatus::Downloading;
}

double TransferTask::progress() const {
  if(total_bytes == 0) return status == TransferStatus::Completed ? 1.0 : 0.0;
  return static_cast<double>(transferred_bytes) / static_cast<double>(total_bytes);
}

nlohmann::json TransferTask::to_json() const {
  nlohmann::json j{
    {"id", id},
    {"fileName", file_name},
    {"filePath", file_path.string()},
    {"remotePath", remote_path},
    {"type", to_string(type)},
    {"totalBytes", total_bytes},
    {"transferredBytes", transferred_bytes},
    {"speed", speed},
    {"status", to_string(status)},
    {"startTime", to_epoch_ms(start_time)},
    {"metadata", metadata},
  };
  j["endTime"] = end_time ? nlohmann::json(to_epoch_ms(*end_time)) : nlohmann::json(nullptr);
  if(!error_message.empty()) {
    j["errorMessage"] = error_message;
    j["errorKind"] = ::to_string(error_kind);
  }
  return j;
}

TransferManager::TransferManager(asio::io_context& io, EngineConfig config, std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfers")),
    ftp_(std::make_unique<FtpClient>(io, config_.connect_timeout, config_.io_timeout, logger_)),
    http_(std::make_unique<HttpClient>(io, config_.connect_timeout, config_.io_timeout, logger_)) {
  if(config_.concurrent_transfers == 0) config_.concurrent_transfers = 1;
  auto http = std::make_shared<HttpTransferExecutor>(*http_);
  executors_[TransferProtocol::Ftp] = std::make_shared<FtpTransferExecutor>(*ftp_, config_.ftp_retry_count, logger_);
  executors_[TransferProtocol::Http] = http;
  executors_[TransferProtocol::Https] = http;
  executors_[TransferProtocol::Sftp] =
    std::make_shared<UnsupportedTransferExecutor>(io_, "sftp transfers are not supported");
}

TransferManager::~TransferManager() {
  std::lock_guard lg(m_);
  for(auto& [id, entry] : entries_) {
    if(entry.cancel_flag) entry.cancel_flag->store(true);
  }
}

void TransferManager::set_executor(TransferProtocol protocol, std::shared_ptr<TransferExecutor> executor) {
  std::lock_guard lg(m_);
  if(executor) {
    executors_[protocol] = std::move(executor);
  } else {
    executors_.erase(protocol);
  }
}

std::string TransferManager::next_task_id() {
  return "tx-" + std::to_string(to_epoch_ms(std::chrono::system_clock::now())) + "-" + std::to_string(++next_seq_);
}

TransferTask TransferManager::enqueue_upload(const Endpoint& endpoint,
                                             const fs::path& local_path,
                                             const std::string& remote_path) {
  auto remote = remote_path.empty() ? endpoint.remote_path : remote_path;
  return enqueue(TransferDirection::Upload, endpoint, local_path, remote);
}

TransferTask TransferManager::enqueue_download(const Endpoint& endpoint,
                                               const std::string& remote_path,
                                               const fs::path& local_path) {
  return enqueue(TransferDirection::Download, endpoint, local_path, remote_path);
}

TransferTask TransferManager::enqueue(TransferDirection direction,
                                      const Endpoint& endpoint,
                                      const fs::path& local_path,
                                      const std::string& remote_path) {
  TransferTask task;
  task.type = direction;
  task.file_path = local_path;
  task.remote_path = remote_path;
  task.start_time = std::chrono::system_clock::now();
  task.metadata["connectionId"] = endpoint.connection_id;
  task.metadata["connectionName"] = endpoint.connection_name;
  task.metadata["remotePath"] = remote_path.empty() ? std::string("/") : remote_path;
  if(direction == TransferDirection::Upload) {
    task.file_name = local_path.filename().string();
  } else {
    auto slash = remote_path.rfind('/');
    task.file_name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    if(task.file_name.empty()) task.file_name = local_path.filename().string();
  }

  std::optional<EngineError> immediate;
  if(direction == TransferDirection::Upload) {
    std::error_code ec;
    bool regular = fs::is_regular_file(local_path, ec);
    auto size = regular ? fs::file_size(local_path, ec) : 0;
    if(!regular || ec) {
      immediate = NotFoundError("file does not exist: " + local_path.string());
    } else {
      task.total_bytes = size;
    }
  }

  std::vector<Launch> launches;
  std::vector<TransferTask> events;
  TransferTask result;
  std::unique_lock delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    task.id = next_task_id();
    if(!immediate) {
      auto it = executors_.find(endpoint.protocol);
      if(it == executors_.end() || !it->second) {
        immediate = ProtocolError(std::string("no transfer support for ") + to_string(endpoint.protocol));
      } else if(!it->second->supports(direction)) {
        auto reason = it->second->unsupported_reason();
        immediate = ProtocolError(reason.empty() ? std::string(to_string(endpoint.protocol)) + " " + to_string(direction) + " is not supported" : reason);
      }
    }

    if(immediate) {
      task.status = TransferStatus::Failed;
      task.end_time = std::chrono::system_clock::now();
      task.error_kind = immediate->kind();
      task.error_message = immediate->what();
      history_.push_back(task);
      while(history_.size() > config_.history_limit && !history_.empty()) history_.pop_front();
      events.push_back(task);
      result = task;
    } else {
      Entry entry;
      entry.task = task;
      entry.job.task_id = task.id;
      entry.job.direction = direction;
      entry.job.endpoint = endpoint;
      entry.job.local_path = local_path;
      entry.job.remote_path = remote_path;
      entry.seq = next_seq_;
      entries_.emplace(task.id, std::move(entry));
      pending_.push_back(task.id);
      events.push_back(task);
      dispatch_locked(launches, events);
      result = entries_.at(task.id).task;
    }
  }

  if(immediate) {
    logger_->warn("{} of {} failed: {}", to_string(direction), task.file_name, task.error_message);
  } else {
    logger_->info("Queued {} {} ({} via {})", to_string(direction), task.file_name, task.id,
                  endpoint.connection_name.empty() ? endpoint.host : endpoint.connection_name);
  }
  for(const auto& event : events) progress_.notify(event);
  delivery.unlock();
  launch(std::move(launches));
  return result;
}

void TransferManager::dispatch_locked(std::vector<Launch>& launches, std::vector<TransferTask>& events) {
  while(active_.size() < config_.concurrent_transfers && !pending_.empty()) {
    auto id = pending_.front();
    pending_.pop_front();
    auto it = entries_.find(id);
    if(it == entries_.end()) continue;
    auto& entry = it->second;

    auto exec = executors_.find(entry.job.endpoint.protocol);
    if(exec == executors_.end() || !exec->second) {
      entry.task.status = TransferStatus::Failed;
      entry.task.error_kind = ErrorKind::Protocol;
      entry.task.error_message = std::string("no transfer support for ") + to_string(entry.job.endpoint.protocol);
      entry.task.end_time = std::chrono::system_clock::now();
      events.push_back(entry.task);
      retire_locked(id);
      continue;
    }

    entry.task.status = entry.job.direction == TransferDirection::Upload
      ? TransferStatus::Uploading : TransferStatus::Downloading;
    entry.task.speed = 0.0;
    entry.run_id = ++next_run_;
    entry.cancel_flag = std::make_shared<std::atomic<bool>>(false);
    entry.run_started = std::chrono::steady_clock::now();
    active_.insert(id);
    launches.push_back({exec->second, entry.job, entry.cancel_flag, entry.run_id});
    events.push_back(entry.task);
  }
}

void TransferManager::launch(std::vector<Launch> launches) {
  for(auto& l : launches) {
    auto id = l.job.task_id;
    auto run = l.run_id;
    try {
      l.executor->start(l.job, l.cancel_flag,
        [this, id, run](uint64_t transferred, uint64_t total){ on_progress(id, run, transferred, total); },
        [this, id, run](const ExecutorResult& result){ on_finished(id, run, result); });
    } catch(const std::exception& e) {
      ExecutorResult failure;
      failure.error_kind = ErrorKind::Protocol;
      failure.error = e.what();
      on_finished(id, run, failure);
    }
  }
}

void TransferManager::on_progress(const std::string& task_id, uint64_t run_id, uint64_t transferred, uint64_t total) {
  TransferTask snapshot;
  std::lock_guard delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(task_id);
    if(it == entries_.end()) return;
    auto& entry = it->second;
    if(entry.run_id != run_id || !entry.task.active()) return;

    auto& task = entry.task;
    if(total > 0 && (task.total_bytes == 0 || task.type == TransferDirection::Download)) {
      task.total_bytes = total;
    }
    task.transferred_bytes = std::max(task.transferred_bytes, transferred);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - entry.run_started).count();
    task.speed = elapsed_ms > 0 ? static_cast<double>(transferred) / static_cast<double>(elapsed_ms) * 1000.0 : 0.0;
    snapshot = task;
  }
  progress_.notify(snapshot);
}

void TransferManager::on_finished(const std::string& task_id, uint64_t run_id, const ExecutorResult& result) {
  std::vector<Launch> launches;
  std::vector<TransferTask> events;
  TransferTask finished;
  std::unique_lock delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(task_id);
    if(it == entries_.end()) return;
    auto& entry = it->second;
    if(entry.run_id != run_id || !entry.task.active()) return;

    active_.erase(task_id);
    auto& task = entry.task;
    task.end_time = std::chrono::system_clock::now();
    task.speed = 0.0;
    if(result.success) {
      task.status = TransferStatus::Completed;
      if(task.total_bytes == 0) task.total_bytes = std::max(task.transferred_bytes, result.bytes);
      task.transferred_bytes = task.total_bytes;
    } else {
      task.status = TransferStatus::Failed;
      task.error_kind = result.error_kind == ErrorKind::None ? ErrorKind::Connectivity : result.error_kind;
      task.error_message = result.error.empty() ? std::string("transfer failed") : result.error;
    }
    finished = task;
    events.push_back(task);
    retire_locked(task_id);
    dispatch_locked(launches, events);
  }

  if(finished.status == TransferStatus::Completed) {
    logger_->info("{} {} completed ({} bytes)", to_string(finished.type), finished.file_name, finished.total_bytes);
  } else {
    logger_->error("{} {} failed: {}", to_string(finished.type), finished.file_name, finished.error_message);
  }
  for(const auto& event : events) progress_.notify(event);
  delivery.unlock();
  launch(std::move(launches));
}

void TransferManager::retire_locked(const std::string& task_id) {
  auto it = entries_.find(task_id);
  if(it == entries_.end()) return;
  history_.push_back(std::move(it->second.task));
  entries_.erase(it);
  while(history_.size() > config_.history_limit && !history_.empty()) {
    history_.pop_front();
  }
}

void TransferManager::stop_run_locked(Entry& entry) {
  if(entry.cancel_flag) entry.cancel_flag->store(true);
  entry.cancel_flag.reset();
  entry.run_id = 0;
  entry.task.speed = 0.0;
}

bool TransferManager::pause(const std::string& task_id) {
  std::vector<Launch> launches;
  std::vector<TransferTask> events;
  std::unique_lock delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(task_id);
    if(it == entries_.end()) return false;
    auto& entry = it->second;
    if(entry.task.status == TransferStatus::Pending) {
      pending_.erase(std::remove(pending_.begin(), pending_.end(), task_id), pending_.end());
    } else if(entry.task.active()) {
      active_.erase(task_id);
      stop_run_locked(entry);
    } else {
      return false;
    }
    entry.task.status = TransferStatus::Paused;
    events.push_back(entry.task);
    dispatch_locked(launches, events);
  }
  logger_->info("Paused {}", task_id);
  for(const auto& event : events) progress_.notify(event);
  delivery.unlock();
  launch(std::move(launches));
  return true;
}

bool TransferManager::resume(const std::string& task_id) {
  std::vector<Launch> launches;
  std::vector<TransferTask> events;
  std::unique_lock delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(task_id);
    if(it == entries_.end() || it->second.task.status != TransferStatus::Paused) return false;
    it->second.task.status = TransferStatus::Pending;
    pending_.push_back(task_id);
    events.push_back(it->second.task);
    dispatch_locked(launches, events);
  }
  logger_->info("Resumed {}", task_id);
  for(const auto& event : events) progress_.notify(event);
  delivery.unlock();
  launch(std::move(launches));
  return true;
}

bool TransferManager::cancel(const std::string& task_id) {
  std::vector<Launch> launches;
  std::vector<TransferTask> events;
  std::unique_lock delivery(delivery_m_);
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(task_id);
    if(it == entries_.end()) return false;
    auto& entry = it->second;
    if(entry.task.status == TransferStatus::Pending) {
      pending_.erase(std::remove(pending_.begin(), pending_.end(), task_id), pending_.end());
    } else if(entry.task.active()) {
      active_.erase(task_id);
    }
    stop_run_locked(entry);
    entry.task.status = TransferStatus::Cancelled;
    entry.task.end_time = std::chrono::system_clock::now();
    retire_locked(task_id);
    dispatch_locked(launches, events);
  }
  logger_->info("Cancelled {}", task_id);
  for(const auto& event : events) progress_.notify(event);
  delivery.unlock();
  launch(std::move(launches));
  return true;
}

std::size_t TransferManager::cancel_for_connection(const std::string& connection_id) {
  if(connection_id.empty()) return 0;
  std::vector<std::string> ids;
  {
    std::lock_guard lg(m_);
    for(const auto& [id, entry] : entries_) {
      if(entry.job.endpoint.connection_id == connection_id) ids.push_back(id);
    }
  }
  std::size_t cancelled = 0;
  for(const auto& id : ids) {
    if(cancel(id)) ++cancelled;
  }
  return cancelled;
}

std::optional<TransferTask> TransferManager::task(const std::string& task_id) const {
  std::lock_guard lg(m_);
  auto it = entries_.find(task_id);
  if(it != entries_.end()) return it->second.task;
  for(auto h = history_.rbegin(); h != history_.rend(); ++h) {
    if(h->id == task_id) return *h;
  }
  return std::nullopt;
}

std::vector<TransferTask> TransferManager::tasks() const {
  std::vector<const Entry*> ordered;
  std::lock_guard lg(m_);
  ordered.reserve(entries_.size());
  for(const auto& [id, entry] : entries_) ordered.push_back(&entry);
  std::sort(ordered.begin(), ordered.end(), [](const Entry* a, const Entry* b){ return a->seq < b->seq; });
  std::vector<TransferTask> out;
  out.reserve(ordered.size());
  for(const auto* entry : ordered) out.push_back(entry->task);
  return out;
}

std::vector<TransferTask> TransferManager::history() const {
  std::lock_guard lg(m_);
  return std::vector<TransferTask>(history_.begin(), history_.end());
}

std::size_t TransferManager::active_count() const {
  std::lock_guard lg(m_);
  return active_.size();
}

std::size_t TransferManager::pending_count() const {
  std::lock_guard lg(m_);
  return pending_.size();
}

double TransferManager::total_speed() const {
  std::lock_guard lg(m_);
  double total = 0.0;
  for(const auto& id : active_) {
    auto it = entries_.find(id);
    if(it != entries_.end()) total += it->second.task.speed;
  }
  return total;
}

namespace {

void post_unsupported(asio::io_context& io, TransferManager::RemoteOpCallback done, const std::string& what) {
  RemoteOpResult result;
  result.error_kind = ErrorKind::Protocol;
  result.error = what + " is only supported for FTP connections";
  asio::post(io, [done = std::move(done), result](){ if(done) done(result); });
}

RemoteOpResult from_ftp(const FtpResult& r) {
  RemoteOpResult out;
  out.success = r.success;
  out.error_kind = r.error_kind;
  out.error = r.error;
  out.names = r.names;
  return out;
}

FtpEndpoint ftp_endpoint(const ConnectionProfile& profile) {
  return FtpEndpoint{profile.host, profile.effective_port(), profile.user, profile.secret};
}

} // namespace

void TransferManager::list_remote_files(const ConnectionProfile& profile, const std::string& path, RemoteOpCallback done) {
  if(profile.protocol != TransferProtocol::Ftp) {
    post_unsupported(io_, std::move(done), "remote listing");
    return;
  }
  auto dir = path.empty() ? profile.remote_path : path;
  ftp_->list(ftp_endpoint(profile), dir, [done = std::move(done)](const FtpResult& r){
    if(done) done(from_ftp(r));
  });
}

void TransferManager::make_remote_directory(const ConnectionProfile& profile, const std::string& path, RemoteOpCallback done) {
  if(profile.protocol != TransferProtocol::Ftp) {
    post_unsupported(io_, std::move(done), "creating remote directories");
    return;
  }
  ftp_->make_directory(ftp_endpoint(profile), path, [done = std::move(done)](const FtpResult& r){
    if(done) done(from_ftp(r));
  });
}

SubscriptionHandle TransferManager::on_transfer_progress(std::function<void(const TransferTask&)> listener) {
  return progress_.add(std::move(listener));
}

void TransferManager::remove_progress_listener(SubscriptionHandle handle) {
  progress_.remove(handle);
}
