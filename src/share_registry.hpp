#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"

class AddressResolver;
class KeyValueStore;
class Logger;

enum class ShareType { SingleFile, MultiFile };

const char* to_string(ShareType type);

struct ShareRecord {
  std::string share_id;
  ShareType type = ShareType::SingleFile;
  std::vector<std::filesystem::path> file_paths;
  std::vector<std::string> file_names;
  uint64_t file_size = 0;                  // sum over all files
  std::chrono::system_clock::time_point created_at{};
  uint64_t download_count = 0;
  std::string device_id;

  nlohmann::json to_json() const;
  static ShareRecord from_json(const nlohmann::json& j);
};

struct ShareInfo {
  ShareRecord record;
  std::string url;
  bool is_expired = false;
  std::chrono::milliseconds time_remaining{0};

  nlohmann::json to_json() const;
};

struct ShareLink {
  std::string share_id;
  std::string url;
};

// Everything a QR encoder needs; rendering happens elsewhere.
struct QrPayload {
  std::string data;
  std::string error_correction = "L";
  int version = 0;                         // 0 = smallest that fits

  nlohmann::json to_json() const;
};

class ShareLinkRegistry {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  ShareLinkRegistry(std::shared_ptr<KeyValueStore> store,
                    EngineConfig config,
                    std::shared_ptr<AddressResolver> resolver,
                    std::shared_ptr<Logger> logger = nullptr,
                    Clock clock = nullptr);

  ShareLink generate_shareable_link(const std::filesystem::path& file_path);
  ShareLink generate_multi_file_link(const std::vector<std::filesystem::path>& file_paths);
  QrPayload generate_qr_code(const std::string& data) const;

  // Throws NotFoundError for unknown ids.
  ShareInfo get_share_info(const std::string& share_id) const;

  // Copies the shared file(s) and bumps downloadCount. A single-file share
  // lands at dest, or inside dest when dest is an existing directory; a
  // multi-file share always lands inside dest. Returns the written paths.
  std::vector<std::filesystem::path> download_shared_file(const std::string& share_id,
                                                          const std::filesystem::path& dest);

  // Server side of a download: checks expiry and returns the record without
  // copying anything. record_download() bumps the counter afterwards.
  ShareRecord open_share(const std::string& share_id) const;
  void record_download(const std::string& share_id);

  std::size_t cleanup_expired_shares();
  std::vector<ShareInfo> list_active_shares() const;
  bool revoke(const std::string& share_id);

  bool is_expired(const ShareRecord& record) const;
  std::chrono::milliseconds time_remaining(const ShareRecord& record) const;
  std::string share_url(const ShareRecord& record) const;

  const std::string& device_id() const { return device_id_; }
  void set_clock(Clock clock);

private:
  ShareLink mint(ShareRecord record);
  std::optional<ShareRecord> load_locked(const std::string& share_id) const;
  bool store_locked(const ShareRecord& record);
  std::string new_share_id() const;
  std::chrono::system_clock::time_point now() const;

  std::shared_ptr<KeyValueStore> store_;
  EngineConfig config_;
  std::shared_ptr<AddressResolver> resolver_;
  std::shared_ptr<Logger> logger_;
  std::string device_id_;

  mutable std::mutex m_;
  Clock clock_;
};
