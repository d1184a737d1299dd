#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Opaque key/blob persistence. Keys are '/'-separated, e.g. "shares/<id>".
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  virtual bool save(const std::string& key, const std::string& bytes) = 0;
  virtual std::optional<std::string> load(const std::string& key) const = 0;
  virtual bool remove(const std::string& key) = 0;
  virtual std::vector<std::string> list_keys(const std::string& prefix) const = 0;
};

// One file per key below root. Writes go through a temp file and rename.
class FileKeyValueStore : public KeyValueStore {
public:
  explicit FileKeyValueStore(std::filesystem::path root);

  bool save(const std::string& key, const std::string& bytes) override;
  std::optional<std::string> load(const std::string& key) const override;
  bool remove(const std::string& key) override;
  std::vector<std::string> list_keys(const std::string& prefix) const override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::optional<std::filesystem::path> path_for(const std::string& key) const;

  std::filesystem::path root_;
  mutable std::mutex m_;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
  bool save(const std::string& key, const std::string& bytes) override;
  std::optional<std::string> load(const std::string& key) const override;
  bool remove(const std::string& key) override;
  std::vector<std::string> list_keys(const std::string& prefix) const override;

private:
  mutable std::mutex m_;
  std::map<std::string, std::string> entries_;
};

// Credentials live here, never in the KeyValueStore.
class SecretStore {
public:
  virtual ~SecretStore() = default;

  virtual bool put(const std::string& id, const std::string& secret) = 0;
  virtual std::optional<std::string> get(const std::string& id) const = 0;
  virtual bool erase(const std::string& id) = 0;
};

// Secrets as owner-only (0600) files in a 0700 directory.
class FileSecretStore : public SecretStore {
public:
  explicit FileSecretStore(std::filesystem::path root);

  bool put(const std::string& id, const std::string& secret) override;
  std::optional<std::string> get(const std::string& id) const override;
  bool erase(const std::string& id) override;

private:
  std::optional<std::filesystem::path> path_for(const std::string& id) const;

  std::filesystem::path root_;
  mutable std::mutex m_;
};

class MemorySecretStore : public SecretStore {
public:
  bool put(const std::string& id, const std::string& secret) override;
  std::optional<std::string> get(const std::string& id) const override;
  bool erase(const std::string& id) override;

private:
  mutable std::mutex m_;
  std::map<std::string, std::string> secrets_;
};

bool is_safe_key_segment(const std::string& segment);
