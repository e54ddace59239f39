#include "counter_allocator.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include "internal/cache/cache_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::counter {

using shortener::observability::BoolField;
using shortener::observability::IntField;
using shortener::observability::StringField;

CounterAllocator::CounterAllocator(std::shared_ptr<cache::CacheStore> cache, CounterOptions options)
    : cache_(std::move(cache)), options_(std::move(options)) {
  if (!cache_) {
    throw std::invalid_argument("CounterAllocator requires a cache store");
  }
}

bool CounterAllocator::Initialize() {
  int64_t seed = options_.initial_value;
  if (options_.issued_floor) {
    seed = std::max(seed, options_.issued_floor());
  }

  const bool stored = cache_->WriteIfAbsent(options_.key, std::to_string(seed));
  if (stored) {
    SHORTENER_LOG_INFO("counter initialized",
                       {StringField("key", options_.key), IntField("value", seed), BoolField("resumed", seed != options_.initial_value)});
  }
  return stored;
}

int64_t CounterAllocator::IncrementAndGet() {
  if (auto value = cache_->Increment(options_.key)) {
    return *value;
  }

  if (!options_.auto_initialize) {
    throw util::InvalidState("counter '" + options_.key + "' is not initialized");
  }

  Initialize();
  if (auto value = cache_->Increment(options_.key)) {
    return *value;
  }
  throw util::DependencyUnavailable("counter '" + options_.key + "' vanished during initialization");
}

std::optional<int64_t> CounterAllocator::Current() {
  auto raw = cache_->Read(options_.key);
  if (!raw) return std::nullopt;

  int64_t     value = 0;
  const auto* end   = raw->data() + raw->size();
  auto [ptr, ec]    = std::from_chars(raw->data(), end, value);
  if (ec != std::errc() || ptr != end) {
    throw util::DependencyUnavailable("counter '" + options_.key + "' holds a non-integer value");
  }
  return value;
}

} // namespace shortener::counter
