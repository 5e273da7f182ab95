#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Thread safe key/value cache whose entries expire after a fixed ttl.
// A zero ttl or zero capacity disables it.
template<typename Value, typename Clock = std::chrono::steady_clock>
class TtlCache {
public:
  TtlCache(std::chrono::seconds ttl, std::size_t maxSize)
    : ttl(ttl), maxSize(maxSize) {}

  bool enabled() const {
    return ttl.count() > 0 && maxSize > 0;
  }

  std::optional<Value> get(const std::string &key) {
    if (!enabled()) {
      return std::nullopt;
    }

    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex);

    auto it = entries.find(key);
    if (it == entries.end()) {
      return std::nullopt;
    }

    if (now >= it->second.expiresAt) {
      entries.erase(it);
      return std::nullopt;
    }

    return it->second.value;
  }

  void put(const std::string &key, Value value) {
    if (!enabled()) {
      return;
    }

    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex);

    if (entries.size() >= maxSize && !entries.contains(key)) {
      evict(now);
    }

    entries.insert_or_assign(key, Entry{std::move(value), now + ttl});
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
  }

private:
  struct Entry {
    Value
      value;
    typename Clock::time_point
      expiresAt;
  };

  // Drops every expired entry; when none expired, the one closest to expiry
  void evict(typename Clock::time_point now) {
    std::erase_if(entries, [&](const auto &item) { return now >= item.second.expiresAt; });

    if (entries.size() < maxSize) {
      return;
    }

    auto oldest = std::min_element(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
      return a.second.expiresAt < b.second.expiresAt;
    });
    entries.erase(oldest);
  }

  const std::chrono::seconds
    ttl;
  const std::size_t
    maxSize;
  std::mutex
    mutex;
  std::unordered_map<std::string, Entry>
    entries;
};
