#include "share_registry.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <set>

#include "errors.hpp"
#include "log.hpp"
#include "net_address.hpp"
#include "storage.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::string kSharePrefix = "shares/";

std::string share_key(const std::string& share_id) {
  return kSharePrefix + share_id;
}

} // namespace

const char* to_string(ShareType type) {
  return type == ShareType::MultiFile ? "multi_file" : "single_file";
}

nlohmann::json ShareRecord::to_json() const {
  nlohmann::json j{
    {"shareId", share_id},
    {"type", to_string(type)},
    {"fileSize", file_size},
    {"createdAt", to_epoch_ms(created_at)},
    {"downloadCount", download_count},
    {"deviceId", device_id},
  };
  if(type == ShareType::SingleFile && file_paths.size() == 1) {
    j["filePath"] = file_paths.front().string();
    j["fileName"] = file_names.empty() ? file_paths.front().filename().string() : file_names.front();
  } else {
    auto paths = nlohmann::json::array();
    for(const auto& p : file_paths) paths.push_back(p.string());
    j["filePaths"] = paths;
    j["fileNames"] = file_names;
  }
  return j;
}

ShareRecord ShareRecord::from_json(const nlohmann::json& j) {
  ShareRecord r;
  r.share_id = j.at("shareId").get<std::string>();
  r.type = j.value("type", std::string("single_file")) == "multi_file" ? ShareType::MultiFile : ShareType::SingleFile;
  if(j.contains("filePath")) {
    r.file_paths.emplace_back(j.at("filePath").get<std::string>());
    r.file_names.push_back(j.value("fileName", r.file_paths.back().filename().string()));
  } else {
    for(const auto& p : j.at("filePaths")) r.file_paths.emplace_back(p.get<std::string>());
    r.file_names = j.value("fileNames", std::vector<std::string>{});
  }
  r.file_size = j.value("fileSize", uint64_t{0});
  r.created_at = from_epoch_ms(j.value("createdAt", int64_t{0}));
  r.download_count = j.value("downloadCount", uint64_t{0});
  r.device_id = j.value("deviceId", std::string());
  return r;
}

nlohmann::json ShareInfo::to_json() const {
  auto j = record.to_json();
  j["url"] = url;
  j["isExpired"] = is_expired;
  j["timeRemainingMs"] = time_remaining.count();
  return j;
}

nlohmann::json QrPayload::to_json() const {
  return nlohmann::json{
    {"data", data},
    {"errorCorrection", error_correction},
    {"version", version},
  };
}

ShareLinkRegistry::ShareLinkRegistry(std::shared_ptr<KeyValueStore> store,
                                     EngineConfig config,
                                     std::shared_ptr<AddressResolver> resolver,
                                     std::shared_ptr<Logger> logger,
                                     Clock clock)
  : store_(std::move(store)),
    config_(std::move(config)),
    resolver_(std::move(resolver)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("shares")),
    clock_(std::move(clock)) {
  if(!store_) throw std::invalid_argument("ShareLinkRegistry needs a KeyValueStore");
  device_id_ = config_.device_id.empty() ? sha256_hex(host_name()).substr(0, 16) : config_.device_id;
}

void ShareLinkRegistry::set_clock(Clock clock) {
  std::lock_guard lg(m_);
  clock_ = std::move(clock);
}

std::chrono::system_clock::time_point ShareLinkRegistry::now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::string ShareLinkRegistry::new_share_id() const {
  return fmt::format("{:013d}-{}", to_epoch_ms(now()), random_hex(4));
}

ShareLink ShareLinkRegistry::generate_shareable_link(const fs::path& file_path) {
  std::error_code ec;
  if(!fs::is_regular_file(file_path, ec)) {
    throw NotFoundError("file does not exist: " + file_path.string());
  }
  ShareRecord record;
  record.type = ShareType::SingleFile;
  record.file_paths.push_back(fs::absolute(file_path, ec));
  if(ec) record.file_paths.back() = file_path;
  record.file_names.push_back(file_path.filename().string());
  record.file_size = fs::file_size(file_path, ec);
  if(ec) throw NotFoundError("cannot stat " + file_path.string() + ": " + ec.message());
  return mint(std::move(record));
}

ShareLink ShareLinkRegistry::generate_multi_file_link(const std::vector<fs::path>& file_paths) {
  if(file_paths.empty()) throw std::invalid_argument("no files to share");
  ShareRecord record;
  record.type = ShareType::MultiFile;
  for(const auto& path : file_paths) {
    std::error_code ec;
    if(!fs::is_regular_file(path, ec)) {
      throw NotFoundError("file does not exist: " + path.string());
    }
    auto size = fs::file_size(path, ec);
    if(ec) throw NotFoundError("cannot stat " + path.string() + ": " + ec.message());
    auto absolute = fs::absolute(path, ec);
    record.file_paths.push_back(ec ? path : absolute);
    record.file_names.push_back(path.filename().string());
    record.file_size += size;
  }
  return mint(std::move(record));
}

ShareLink ShareLinkRegistry::mint(ShareRecord record) {
  ShareLink link;
  {
    std::lock_guard lg(m_);
    record.created_at = now();
    record.device_id = device_id_;
    record.download_count = 0;
    do {
      record.share_id = new_share_id();
    } while(store_->load(share_key(record.share_id)));
    if(!store_locked(record)) {
      throw std::runtime_error("failed to persist share " + record.share_id);
    }
    link.share_id = record.share_id;
  }
  link.url = share_url(record);
  logger_->info("Shared {} file(s) as {} ({} bytes)", record.file_paths.size(), link.share_id, record.file_size);
  return link;
}

QrPayload ShareLinkRegistry::generate_qr_code(const std::string& data) const {
  if(data.empty()) throw std::invalid_argument("QR payload data is empty");
  QrPayload payload;
  payload.data = data;
  return payload;
}

std::optional<ShareRecord> ShareLinkRegistry::load_locked(const std::string& share_id) const {
  if(!is_safe_key_segment(share_id)) return std::nullopt;
  auto bytes = store_->load(share_key(share_id));
  if(!bytes) return std::nullopt;
  try {
    return ShareRecord::from_json(nlohmann::json::parse(*bytes));
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Ignoring unreadable share record {}: {}", share_id, e.what());
    return std::nullopt;
  }
}

bool ShareLinkRegistry::store_locked(const ShareRecord& record) {
  return store_->save(share_key(record.share_id), record.to_json().dump());
}

bool ShareLinkRegistry::is_expired(const ShareRecord& record) const {
  return now() - record.created_at > config_.share_expiry;
}

std::chrono::milliseconds ShareLinkRegistry::time_remaining(const ShareRecord& record) const {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    record.created_at + config_.share_expiry - now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::string ShareLinkRegistry::share_url(const ShareRecord& record) const {
  std::string base = config_.share_base_url;
  if(base.empty()) {
    std::optional<std::string> ip;
    if(resolver_) ip = resolver_->local_ip();
    base = "https://" + ip.value_or("localhost");
  }
  while(!base.empty() && base.back() == '/') base.pop_back();
  return base + (record.type == ShareType::MultiFile ? "/files/" : "/file/") + record.share_id;
}

ShareInfo ShareLinkRegistry::get_share_info(const std::string& share_id) const {
  ShareInfo info;
  {
    std::lock_guard lg(m_);
    auto record = load_locked(share_id);
    if(!record) throw NotFoundError("unknown share " + share_id);
    info.record = std::move(*record);
    info.is_expired = is_expired(info.record);
    info.time_remaining = info.is_expired ? std::chrono::milliseconds(0) : time_remaining(info.record);
  }
  info.url = share_url(info.record);
  return info;
}

ShareRecord ShareLinkRegistry::open_share(const std::string& share_id) const {
  std::lock_guard lg(m_);
  auto record = load_locked(share_id);
  if(!record) throw NotFoundError("unknown share " + share_id);
  if(is_expired(*record)) throw ShareExpiredError("share " + share_id + " has expired");
  return *record;
}

void ShareLinkRegistry::record_download(const std::string& share_id) {
  std::lock_guard lg(m_);
  auto record = load_locked(share_id);
  if(!record) throw NotFoundError("unknown share " + share_id);
  if(is_expired(*record)) throw ShareExpiredError("share " + share_id + " has expired");
  record->download_count++;
  if(!store_locked(*record)) {
    logger_->error("Failed to persist download count for {}", share_id);
  }
}

namespace {

// "a.txt", then "a (1).txt", "a (2).txt" for later files of the same name.
fs::path unique_target(const fs::path& dir, const std::string& name, std::set<std::string>& taken) {
  fs::path base = fs::path(name).filename();
  auto candidate = base.string();
  for(int n = 1; taken.count(candidate); ++n) {
    candidate = base.stem().string() + " (" + std::to_string(n) + ")" + base.extension().string();
  }
  taken.insert(candidate);
  return dir / candidate;
}

} // namespace

std::vector<fs::path> ShareLinkRegistry::download_shared_file(const std::string& share_id, const fs::path& dest) {
  // expiry check, copy and count happen under one lock
  std::lock_guard lg(m_);
  auto record = load_locked(share_id);
  if(!record) throw NotFoundError("unknown share " + share_id);
  if(is_expired(*record)) throw ShareExpiredError("share " + share_id + " has expired");

  std::vector<fs::path> written;
  std::error_code ec;
  bool into_dir = record->type == ShareType::MultiFile || fs::is_directory(dest, ec);
  if(into_dir) {
    fs::create_directories(dest, ec);
    if(ec) throw std::runtime_error("cannot create " + dest.string() + ": " + ec.message());
  } else if(dest.has_parent_path()) {
    fs::create_directories(dest.parent_path(), ec);
  }

  std::set<std::string> taken;
  for(std::size_t i = 0; i < record->file_paths.size(); ++i) {
    const auto& source = record->file_paths[i];
    if(!fs::is_regular_file(source, ec)) {
      throw NotFoundError("shared file no longer exists: " + source.string());
    }
    auto name = i < record->file_names.size() ? record->file_names[i] : source.filename().string();
    auto target = into_dir ? unique_target(dest, name, taken) : dest;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if(ec) throw std::runtime_error("copy " + source.string() + " -> " + target.string() + " failed: " + ec.message());
    written.push_back(target);
  }

  record->download_count++;
  if(!store_locked(*record)) {
    logger_->error("Failed to persist download count for {}", share_id);
  }
  logger_->info("Share {} downloaded to {}", share_id, dest.string());
  return written;
}

std::size_t ShareLinkRegistry::cleanup_expired_shares() {
  std::size_t removed = 0;
  {
    std::lock_guard lg(m_);
    for(const auto& key : store_->list_keys(kSharePrefix)) {
      auto id = key.substr(kSharePrefix.size());
      auto record = load_locked(id);
      if(!record) continue;
      if(is_expired(*record) && store_->remove(key)) ++removed;
    }
  }
  if(removed > 0) logger_->info("Removed {} expired share(s)", removed);
  return removed;
}

std::vector<ShareInfo> ShareLinkRegistry::list_active_shares() const {
  std::vector<ShareInfo> out;
  {
    std::lock_guard lg(m_);
    for(const auto& key : store_->list_keys(kSharePrefix)) {
      auto record = load_locked(key.substr(kSharePrefix.size()));
      if(!record || is_expired(*record)) continue;
      ShareInfo info;
      info.record = std::move(*record);
      info.time_remaining = time_remaining(info.record);
      out.push_back(std::move(info));
    }
  }
  for(auto& info : out) info.url = share_url(info.record);
  std::sort(out.begin(), out.end(), [](const ShareInfo& a, const ShareInfo& b){
    return a.record.share_id < b.record.share_id;
  });
  return out;
}

bool ShareLinkRegistry::revoke(const std::string& share_id) {
  bool removed = false;
  {
    std::lock_guard lg(m_);
    if(!is_safe_key_segment(share_id)) return false;
    if(store_->load(share_key(share_id))) removed = store_->remove(share_key(share_id));
  }
  if(removed) logger_->info("Revoked share {}", share_id);
  return removed;
}
