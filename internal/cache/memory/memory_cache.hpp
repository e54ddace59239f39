#pragma once

#include <functional>
#include <shared_mutex>
#include <unordered_map>

#include "internal/cache/cache_store.hpp"
#include "internal/util/time.hpp"

namespace shortener::cache::memory {

/*
  Process-local cache tier.

  Atomicity holds across threads of one process only. Deployments running
  several server processes must share a cache backend instead.
*/
class MemoryCache final : public CacheStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  MemoryCache();
  explicit MemoryCache(ClockFn clock);

  bool                       Exists(const std::string& key) override;
  std::optional<std::string> Read(const std::string& key) override;
  void                       Write(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  bool                       WriteIfAbsent(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  std::optional<int64_t>     Increment(const std::string& key, int64_t delta = 1) override;
  void                       Delete(const std::string& key) override;
  void                       Clear() override;

  std::size_t Size() const;

 private:
  struct Entry {
    std::string                    value;
    std::optional<util::TimePoint> expires_at;
  };

  static bool IsLive(const Entry& entry, util::TimePoint now);
  Entry       MakeEntry(const std::string& value, Ttl ttl) const;

  ClockFn clock_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace shortener::cache::memory
