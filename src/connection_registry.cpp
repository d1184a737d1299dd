#include "connection_registry.hpp"

#include "discovery.hpp"
#include "ftp_client.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "storage.hpp"
#include "utils.hpp"

namespace {

const std::string kConnectionPrefix = "connections/";

ProbeResult probe_failure(ErrorKind kind, std::string message) {
  ProbeResult r;
  r.error_kind = kind;
  r.error = std::move(message);
  return r;
}

} // namespace

NetworkProber::NetworkProber(asio::io_context& io, const EngineConfig& config, std::shared_ptr<Logger> logger)
  : io_(io),
    ftp_(std::make_unique<FtpClient>(io, config.connect_timeout, config.connect_timeout, logger)),
    http_(std::make_unique<HttpClient>(io, config.connect_timeout, config.connect_timeout, logger)) {}

NetworkProber::~NetworkProber() = default;

void NetworkProber::probe(const ConnectionProfile& profile, Completion done) {
  switch(profile.protocol) {
    case TransferProtocol::Ftp: {
      if(profile.is_secure) {
        auto r = probe_failure(ErrorKind::Protocol, "FTP over TLS is not supported");
        asio::post(io_, [done, r](){ done(r); });
        return;
      }
      FtpEndpoint endpoint{profile.host, profile.effective_port(), profile.user, profile.secret};
      ftp_->probe(endpoint, [done](const FtpResult& f){
        ProbeResult r;
        r.success = f.success;
        r.error_kind = f.error_kind;
        r.error = f.error;
        done(r);
      });
      return;
    }
    case TransferProtocol::Http:
    case TransferProtocol::Https: {
      HttpCallOptions options;
      for(const auto& [name, value] : profile.custom_headers) options.headers[name] = value;
      options.user = profile.user;
      options.secret = profile.secret;
      http_->head(profile.base_url() + "/", std::move(options), [done](const HttpResult& h){
        ProbeResult r;
        r.success = h.success;
        r.error_kind = h.error_kind;
        r.error = h.error;
        done(r);
      });
      return;
    }
    case TransferProtocol::Sftp:
      break;
  }
  ProbeResult ok;
  ok.success = true;
  asio::post(io_, [done, ok](){ done(ok); });
}

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<KeyValueStore> store,
                                       std::shared_ptr<SecretStore> secrets,
                                       std::shared_ptr<EndpointProber> prober,
                                       std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    secrets_(std::move(secrets)),
    prober_(std::move(prober)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("connections")) {
  if(!store_ || !secrets_ || !prober_) {
    throw std::invalid_argument("ConnectionRegistry needs a store, a secret store and a prober");
  }
}

std::size_t ConnectionRegistry::load() {
  std::map<std::string, ConnectionProfile> loaded;
  for(const auto& key : store_->list_keys(kConnectionPrefix)) {
    auto bytes = store_->load(key);
    if(!bytes) continue;
    try {
      auto profile = ConnectionProfile::from_json(nlohmann::json::parse(*bytes));
      profile.secret.clear();
      loaded[profile.id] = std::move(profile);
    } catch(const std::exception& e) {
      logger_->warn("Skipping unreadable connection {}: {}", key, e.what());
    }
  }
  auto count = loaded.size();
  {
    std::lock_guard lg(m_);
    profiles_ = std::move(loaded);
  }
  logger_->info("Loaded {} connection(s)", count);
  return count;
}

void ConnectionRegistry::add(ConnectionProfile profile, AddCallback done) {
  auto fail = [done](ConnectionProfile p, ErrorKind kind, std::string message){
    AddConnectionResult r;
    r.error_kind = kind;
    r.error = std::move(message);
    r.profile = std::move(p);
    if(done) done(r);
  };

  profile.host = trim_copy(profile.host);
  if(profile.host.empty()) {
    fail(std::move(profile), ErrorKind::Protocol, "host is required");
    return;
  }
  if(profile.id.empty()) profile.id = "conn-" + random_hex(8);
  if(!is_safe_key_segment(profile.id)) {
    fail(std::move(profile), ErrorKind::Protocol, "invalid connection id: " + profile.id);
    return;
  }
  {
    std::lock_guard lg(m_);
    if(profiles_.count(profile.id)) {
      fail(std::move(profile), ErrorKind::Protocol, "connection " + profile.id + " already exists");
      return;
    }
  }

  logger_->info("Probing {}://{}:{}", to_string(profile.protocol), profile.host, profile.effective_port());
  prober_->probe(profile, [this, profile, done, fail](const ProbeResult& probe) mutable {
    if(!probe.success) {
      auto kind = probe.error_kind == ErrorKind::None ? ErrorKind::Connectivity : probe.error_kind;
      logger_->warn("Connection {} rejected: {}", profile.host, probe.error);
      fail(std::move(profile), kind, probe.error.empty() ? std::string("endpoint unreachable") : probe.error);
      return;
    }

    auto now = std::chrono::system_clock::now();
    profile.is_active = true;
    profile.last_connected = now;
    profile.created_at = now;
    profile.updated_at = now;
    {
      std::lock_guard lg(m_);
      if(profiles_.count(profile.id)) {
        fail(std::move(profile), ErrorKind::Protocol, "connection " + profile.id + " already exists");
        return;
      }
      if(!persist_locked(profile)) {
        fail(std::move(profile), ErrorKind::Server, "failed to persist connection");
        return;
      }
      auto stored = profile;
      stored.secret.clear();
      profiles_[profile.id] = std::move(stored);
    }
    logger_->info("Added connection {} ({})", profile.id, profile.name.empty() ? profile.host : profile.name);
    AddConnectionResult r;
    r.success = true;
    r.profile = std::move(profile);
    if(done) done(r);
  });
}

bool ConnectionRegistry::persist_locked(const ConnectionProfile& profile) {
  if(profile.secret.empty()) {
    return store_->save(kConnectionPrefix + profile.id, profile.to_json().dump());
  }
  auto previous = secrets_->get(profile.id);
  if(!secrets_->put(profile.id, profile.secret)) return false;
  if(store_->save(kConnectionPrefix + profile.id, profile.to_json().dump())) return true;

  // the stored profile is unchanged, so its secret must be too
  bool restored = previous ? secrets_->put(profile.id, *previous) : secrets_->erase(profile.id);
  if(!restored) logger_->error("Could not restore the secret of connection {}", profile.id);
  return false;
}

ConnectionProfile ConnectionRegistry::update(ConnectionProfile profile) {
  {
    std::lock_guard lg(m_);
    auto it = profiles_.find(profile.id);
    if(it == profiles_.end()) throw NotFoundError("unknown connection " + profile.id);
    profile.created_at = it->second.created_at;
    if(!profile.last_connected) profile.last_connected = it->second.last_connected;
    profile.updated_at = std::chrono::system_clock::now();
    if(!persist_locked(profile)) {
      throw std::runtime_error("failed to persist connection " + profile.id);
    }
    auto stored = profile;
    stored.secret.clear();
    it->second = std::move(stored);
  }
  logger_->info("Updated connection {}", profile.id);
  return profile;
}

void ConnectionRegistry::remove(const std::string& id) {
  RemovalHook hook;
  {
    std::lock_guard lg(m_);
    auto it = profiles_.find(id);
    if(it == profiles_.end()) throw NotFoundError("unknown connection " + id);
    profiles_.erase(it);
    if(!store_->remove(kConnectionPrefix + id)) {
      logger_->warn("Connection {} had no stored record", id);
    }
    secrets_->erase(id);
    hook = removal_hook_;
  }
  logger_->info("Removed connection {}", id);
  if(hook) hook(id);
}

void ConnectionRegistry::connect_device(const DiscoveredDevice& device, AddCallback done) {
  auto profile = ConnectionProfile::from_device(device);
  if(auto saved = get(profile.id)) {
    logger_->info("Device {} is already connected as {}", device.id, profile.id);
    AddConnectionResult r;
    r.success = true;
    r.profile = std::move(*saved);
    if(done) done(r);
    return;
  }
  add(std::move(profile), std::move(done));
}

bool ConnectionRegistry::disconnect_device(const DiscoveredDevice& device) {
  try {
    remove(ConnectionProfile::id_for_device(device));
  } catch(const NotFoundError&) {
    return false;
  }
  logger_->info("Disconnected device {}", device.id);
  return true;
}

void ConnectionRegistry::set_removal_hook(RemovalHook hook) {
  std::lock_guard lg(m_);
  removal_hook_ = std::move(hook);
}

std::vector<ConnectionProfile> ConnectionRegistry::list() const {
  std::lock_guard lg(m_);
  std::vector<ConnectionProfile> out;
  out.reserve(profiles_.size());
  for(const auto& [id, profile] : profiles_) out.push_back(profile);
  return out;
}

std::vector<ConnectionProfile> ConnectionRegistry::active() const {
  std::lock_guard lg(m_);
  std::vector<ConnectionProfile> out;
  for(const auto& [id, profile] : profiles_) {
    if(profile.is_active) out.push_back(profile);
  }
  return out;
}

std::optional<ConnectionProfile> ConnectionRegistry::get(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = profiles_.find(id);
  if(it == profiles_.end()) return std::nullopt;
  auto profile = it->second;
  profile.secret = secrets_->get(id).value_or(std::string());
  return profile;
}
