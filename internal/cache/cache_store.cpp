#include "cache_store.hpp"

namespace shortener::cache {

std::optional<std::string> CacheStore::FetchOrCompute(const std::string& key, Ttl ttl,
                                                      const std::function<std::optional<std::string>()>& compute) {
  if (auto cached = Read(key)) {
    return cached;
  }

  auto computed = compute();
  if (!computed) {
    return std::nullopt;
  }

  Write(key, *computed, ttl);
  return computed;
}

} // namespace shortener::cache
