#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "log.hpp"

using SubscriptionHandle = std::size_t;

// Listener registry for one event stream. notify() snapshots under the lock
// and calls listeners after releasing it, so a listener may unsubscribe or
// call back into the publisher.
template<typename... Args>
class Subscribers {
public:
  using Listener = std::function<void(const Args&...)>;

  SubscriptionHandle add(Listener listener) {
    if(!listener) return 0;
    auto handle = next_id_.fetch_add(1);
    std::lock_guard lg(m_);
    listeners_.emplace(handle, std::move(listener));
    return handle;
  }

  void remove(SubscriptionHandle handle) {
    std::lock_guard lg(m_);
    listeners_.erase(handle);
  }

  void clear() {
    std::lock_guard lg(m_);
    listeners_.clear();
  }

  std::size_t size() const {
    std::lock_guard lg(m_);
    return listeners_.size();
  }

  void notify(const Args&... args) const {
    std::vector<Listener> snapshot;
    {
      std::lock_guard lg(m_);
      snapshot.reserve(listeners_.size());
      for(const auto& entry : listeners_) snapshot.push_back(entry.second);
    }
    for(const auto& listener : snapshot) {
      try {
        listener(args...);
      } catch(const std::exception& e) {
        log_warn(nullptr, "Subscriber threw: {}", e.what());
      }
    }
  }

private:
  mutable std::mutex m_;
  std::map<SubscriptionHandle, Listener> listeners_;
  std::atomic<SubscriptionHandle> next_id_{1};
};
