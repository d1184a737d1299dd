#include "transfer_executor.hpp"

#include "ftp_client.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "utils.hpp"

const char* to_string(TransferDirection direction) {
  return direction == TransferDirection::Upload ? "upload" : "download";
}

Endpoint Endpoint::from_profile(const ConnectionProfile& profile) {
  Endpoint e;
  e.connection_id = profile.id;
  e.connection_name = profile.name.empty() ? profile.host : profile.name;
  e.protocol = profile.protocol;
  e.host = profile.host;
  e.port = profile.effective_port();
  e.user = profile.user;
  e.secret = profile.secret;
  e.headers = profile.custom_headers;
  e.remote_path = profile.remote_path;
  e.is_secure = profile.is_secure || profile.protocol == TransferProtocol::Https;
  return e;
}

Endpoint Endpoint::from_device(const DiscoveredDevice& device) {
  // not a saved connection, so cancel_for_connection never matches it
  auto e = from_profile(ConnectionProfile::from_device(device));
  e.connection_id.clear();
  return e;
}

std::string Endpoint::base_url() const {
  return std::string(is_secure ? "https" : "http") + "://" + host + ":" + std::to_string(port);
}

FtpTransferExecutor::FtpTransferExecutor(FtpClient& client, std::size_t retry_count, std::shared_ptr<Logger> logger)
  : client_(client),
    retry_count_(retry_count == 0 ? 1 : retry_count),
    logger_(std::move(logger)) {}

void FtpTransferExecutor::start(const TransferJob& job, CancelFlag cancel, Progress progress, Completion done) {
  attempt(job, std::move(cancel), std::move(progress), std::move(done), 1);
}

void FtpTransferExecutor::attempt(TransferJob job, CancelFlag cancel, Progress progress, Completion done, std::size_t number) {
  FtpEndpoint endpoint{job.endpoint.host, job.endpoint.port, job.endpoint.user, job.endpoint.secret};
  FtpTransferOptions options;
  options.on_progress = progress;
  options.cancelled = [cancel](){ return cancel && cancel->load(); };

  auto on_done = [this, job, cancel, progress, done, number](const FtpResult& r){
    bool cancelled = cancel && cancel->load();
    if(!r.success && !cancelled && r.error_kind == ErrorKind::Connectivity && number < retry_count_) {
      log_warn(logger_.get(), "FTP {} of {} failed (attempt {}/{}): {}; retrying",
               to_string(job.direction), job.local_path.filename().string(), number, retry_count_, r.error);
      attempt(job, cancel, progress, done, number + 1);
      return;
    }
    ExecutorResult result;
    result.success = r.success;
    result.error_kind = r.error_kind;
    result.error = r.error;
    result.bytes = r.bytes;
    done(result);
  };

  if(job.direction == TransferDirection::Upload) {
    client_.upload(endpoint, job.local_path, job.remote_path, std::move(options), on_done);
  } else {
    client_.download(endpoint, job.remote_path, job.local_path, std::move(options), on_done);
  }
}

HttpTransferExecutor::HttpTransferExecutor(HttpClient& client)
  : client_(client) {}

std::string HttpTransferExecutor::upload_url(const TransferJob& job) {
  std::string path = job.remote_path.empty() ? std::string("/upload") : job.remote_path;
  if(path.front() != '/') path = "/" + path;
  return job.endpoint.base_url() + path;
}

std::string HttpTransferExecutor::download_url(const TransferJob& job) {
  std::string path = job.remote_path;
  if(path.empty() || path.front() != '/') path = "/" + path;
  return job.endpoint.base_url() + url_encode(path);
}

void HttpTransferExecutor::start(const TransferJob& job, CancelFlag cancel, Progress progress, Completion done) {
  HttpCallOptions options;
  for(const auto& [name, value] : job.endpoint.headers) {
    options.headers[name] = value;
  }
  options.user = job.endpoint.user;
  options.secret = job.endpoint.secret;
  options.on_progress = std::move(progress);
  options.cancelled = [cancel](){ return cancel && cancel->load(); };

  auto on_done = [done = std::move(done)](const HttpResult& r){
    ExecutorResult result;
    result.success = r.success;
    result.error_kind = r.error_kind;
    result.error = r.error;
    result.bytes = r.bytes;
    done(result);
  };

  if(job.direction == TransferDirection::Upload) {
    client_.upload(upload_url(job), job.local_path, "file", std::move(options), std::move(on_done));
  } else {
    client_.download(download_url(job), job.local_path, std::move(options), std::move(on_done));
  }
}

void UnsupportedTransferExecutor::start(const TransferJob&, CancelFlag, Progress, Completion done) {
  ExecutorResult result;
  result.error_kind = ErrorKind::Protocol;
  result.error = reason_;
  asio::post(io_, [done = std::move(done), result](){ done(result); });
}
