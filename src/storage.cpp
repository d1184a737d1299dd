#include "storage.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

#include "log.hpp"

namespace fs = std::filesystem;

bool is_safe_key_segment(const std::string& segment) {
  if(segment.empty() || segment == "." || segment == "..") return false;
  return std::all_of(segment.begin(), segment.end(), [](unsigned char ch){
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.';
  });
}

namespace {

std::optional<fs::path> resolve_key_path(const fs::path& root, const std::string& key) {
  fs::path out = root;
  std::stringstream ss(key);
  std::string segment;
  bool any = false;
  while(std::getline(ss, segment, '/')) {
    if(!is_safe_key_segment(segment)) return std::nullopt;
    out /= segment;
    any = true;
  }
  if(!any) return std::nullopt;
  return out;
}

// Secrets are created 0600 from the first byte; the umask never applies.
bool write_owner_only(const fs::path& path, const std::string& bytes) {
  ::unlink(path.c_str());
  int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if(fd < 0) return false;
  const char* data = bytes.data();
  std::size_t left = bytes.size();
  while(left > 0) {
    auto n = ::write(fd, data, left);
    if(n < 0 && errno == EINTR) continue;
    if(n <= 0) {
      ::close(fd);
      return false;
    }
    data += n;
    left -= static_cast<std::size_t>(n);
  }
  return ::close(fd) == 0;
}

bool write_file_atomically(const fs::path& path, const std::string& bytes, bool owner_only) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  auto tmp = path;
  tmp += ".tmp";
  if(owner_only) {
    if(!write_owner_only(tmp, bytes)) {
      fs::remove(tmp, ec);
      return false;
    }
  } else {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if(!out) return false;
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if(!out) return false;
  }
  fs::rename(tmp, path, ec);
  if(ec) {
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

FileKeyValueStore::FileKeyValueStore(fs::path root)
  : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
}

std::optional<fs::path> FileKeyValueStore::path_for(const std::string& key) const {
  return resolve_key_path(root_, key);
}

bool FileKeyValueStore::save(const std::string& key, const std::string& bytes) {
  auto path = path_for(key);
  if(!path) {
    log_warn(nullptr, "Rejected storage key '{}'", key);
    return false;
  }
  std::lock_guard lg(m_);
  return write_file_atomically(*path, bytes, false);
}

std::optional<std::string> FileKeyValueStore::load(const std::string& key) const {
  auto path = path_for(key);
  if(!path) return std::nullopt;
  std::lock_guard lg(m_);
  return read_file(*path);
}

bool FileKeyValueStore::remove(const std::string& key) {
  auto path = path_for(key);
  if(!path) return false;
  std::lock_guard lg(m_);
  std::error_code ec;
  return fs::remove(*path, ec);
}

std::vector<std::string> FileKeyValueStore::list_keys(const std::string& prefix) const {
  std::vector<std::string> keys;
  std::lock_guard lg(m_);
  std::error_code ec;
  if(!fs::exists(root_, ec)) return keys;
  for(fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if(!it->is_regular_file(ec)) continue;
    auto rel = fs::relative(it->path(), root_, ec).generic_string();
    if(ec) continue;
    if(rel.size() > 4 && rel.compare(rel.size() - 4, 4, ".tmp") == 0) continue;
    if(rel.compare(0, prefix.size(), prefix) == 0) keys.push_back(rel);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

bool MemoryKeyValueStore::save(const std::string& key, const std::string& bytes) {
  std::lock_guard lg(m_);
  entries_[key] = bytes;
  return true;
}

std::optional<std::string> MemoryKeyValueStore::load(const std::string& key) const {
  std::lock_guard lg(m_);
  auto it = entries_.find(key);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
  std::lock_guard lg(m_);
  return entries_.erase(key) > 0;
}

std::vector<std::string> MemoryKeyValueStore::list_keys(const std::string& prefix) const {
  std::lock_guard lg(m_);
  std::vector<std::string> keys;
  for(auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if(it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

FileSecretStore::FileSecretStore(fs::path root)
  : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  fs::permissions(root_, fs::perms::owner_all, fs::perm_options::replace, ec);
}

std::optional<fs::path> FileSecretStore::path_for(const std::string& id) const {
  if(!is_safe_key_segment(id)) return std::nullopt;
  return root_ / (id + ".secret");
}

bool FileSecretStore::put(const std::string& id, const std::string& secret) {
  auto path = path_for(id);
  if(!path) return false;
  std::lock_guard lg(m_);
  return write_file_atomically(*path, secret, true);
}

std::optional<std::string> FileSecretStore::get(const std::string& id) const {
  auto path = path_for(id);
  if(!path) return std::nullopt;
  std::lock_guard lg(m_);
  return read_file(*path);
}

bool FileSecretStore::erase(const std::string& id) {
  auto path = path_for(id);
  if(!path) return false;
  std::lock_guard lg(m_);
  std::error_code ec;
  return fs::remove(*path, ec);
}

bool MemorySecretStore::put(const std::string& id, const std::string& secret) {
  std::lock_guard lg(m_);
  secrets_[id] = secret;
  return true;
}

std::optional<std::string> MemorySecretStore::get(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = secrets_.find(id);
  if(it == secrets_.end()) return std::nullopt;
  return it->second;
}

bool MemorySecretStore::erase(const std::string& id) {
  std::lock_guard lg(m_);
  return secrets_.erase(id) > 0;
}
