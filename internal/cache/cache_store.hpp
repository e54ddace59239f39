#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace shortener::cache {

using Ttl = std::optional<std::chrono::milliseconds>;

/*
  Shared key/value cache tier.

  Holds the allocation counter and the resolution cache. Values are raw
  byte strings; counters are stored as decimal text.

  GUARANTEES every backend must provide:

  - Increment is atomic and linearizable across all callers sharing the
    backend (threads, and processes where the backend is shared)
  - WriteIfAbsent never overwrites a live entry; exactly one concurrent
    caller wins
  - Expiry is passive: an expired entry behaves as absent on access

  Backend failures are reported as util::DependencyUnavailable.
*/
class CacheStore {
 public:
  virtual ~CacheStore() = default;

  virtual bool Exists(const std::string& key) = 0;

  virtual std::optional<std::string> Read(const std::string& key) = 0;

  virtual void Write(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) = 0;

  // Returns true when this call stored the value.
  virtual bool WriteIfAbsent(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) = 0;

  // Adds delta and returns the new value. nullopt when the key is absent.
  virtual std::optional<int64_t> Increment(const std::string& key, int64_t delta = 1) = 0;

  virtual void Delete(const std::string& key) = 0;

  // Administrative: drops every entry, counters included.
  virtual void Clear() = 0;

  /*
    Cache-aside read.

    Hit: returns the cached value, compute is not called.
    Miss: calls compute; a value is written under ttl and returned,
    nullopt is returned as is and nothing is cached.
  */
  std::optional<std::string> FetchOrCompute(const std::string& key, Ttl ttl,
                                            const std::function<std::optional<std::string>()>& compute);
};

} // namespace shortener::cache
