#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace shortener::cache {
class CacheStore;
}

namespace shortener::counter {

inline constexpr const char* kDefaultCounterKey   = "url_counter";
inline constexpr int64_t     kDefaultInitialValue = 1'000'000'000;

struct CounterOptions {
  std::string key           = kDefaultCounterKey;
  int64_t     initial_value = kDefaultInitialValue;

  // Initialize on demand when an increment finds the counter absent.
  bool auto_initialize = false;

  // Highest value already handed out, read from the durable store.
  // Initialize never seeds the counter below it.
  std::function<int64_t()> issued_floor;
};

/*
  Hands out values of one named counter living in the cache tier.

  The allocator keeps no state of its own: uniqueness of returned values
  rests entirely on the cache tier's atomic increment, so any number of
  allocators (threads or processes) may share one counter.
*/
class CounterAllocator {
 public:
  CounterAllocator(std::shared_ptr<cache::CacheStore> cache, CounterOptions options = {});

  // Sets the counter to max(initial value, issued floor) unless it already
  // exists. Returns true when this call performed the write.
  bool Initialize();

  // Atomically increments and returns the new value.
  // Throws util::InvalidState when the counter is absent and
  // auto_initialize is off.
  int64_t IncrementAndGet();

  std::optional<int64_t> Current();

  const CounterOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<cache::CacheStore> cache_;
  CounterOptions                     options_;
};

} // namespace shortener::counter
