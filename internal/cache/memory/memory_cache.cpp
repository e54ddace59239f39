#include "memory_cache.hpp"

#include <charconv>
#include <mutex>

#include "internal/util/errors.hpp"

namespace shortener::cache::memory {

MemoryCache::MemoryCache() : MemoryCache(&util::Now) {
}

MemoryCache::MemoryCache(ClockFn clock) : clock_(std::move(clock)) {
}

bool MemoryCache::IsLive(const Entry& entry, util::TimePoint now) {
  return !entry.expires_at || *entry.expires_at > now;
}

MemoryCache::Entry MemoryCache::MakeEntry(const std::string& value, Ttl ttl) const {
  Entry entry;
  entry.value = value;
  if (ttl) entry.expires_at = clock_() + *ttl;
  return entry;
}

bool MemoryCache::Exists(const std::string& key) {
  return Read(key).has_value();
}

std::optional<std::string> MemoryCache::Read(const std::string& key) {
  const auto now = clock_();
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (IsLive(it->second, now)) return it->second.value;
  }

  // lazily drop the expired entry
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it != entries_.end() && !IsLive(it->second, now)) entries_.erase(it);
  return std::nullopt;
}

void MemoryCache::Write(const std::string& key, const std::string& value, Ttl ttl) {
  auto             entry = MakeEntry(value, ttl);
  std::unique_lock lock(mutex_);
  entries_[key] = std::move(entry);
}

bool MemoryCache::WriteIfAbsent(const std::string& key, const std::string& value, Ttl ttl) {
  auto             entry = MakeEntry(value, ttl);
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it != entries_.end() && IsLive(it->second, clock_())) {
    return false;
  }
  entries_[key] = std::move(entry);
  return true;
}

std::optional<int64_t> MemoryCache::Increment(const std::string& key, int64_t delta) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || !IsLive(it->second, clock_())) {
    return std::nullopt;
  }

  auto&       raw     = it->second.value;
  int64_t     current = 0;
  const auto* end     = raw.data() + raw.size();
  auto [ptr, ec]      = std::from_chars(raw.data(), end, current);
  if (ec != std::errc() || ptr != end) {
    throw util::DependencyUnavailable("cache value at '" + key + "' is not an integer");
  }

  const int64_t next = current + delta;
  raw                = std::to_string(next);
  return next;
}

void MemoryCache::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  entries_.erase(key);
}

void MemoryCache::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

std::size_t MemoryCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace shortener::cache::memory
