#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/link_record.hpp"

namespace shortener::db {
class Repository;
}
namespace shortener::cache {
class CacheStore;
}

namespace shortener::core {

inline constexpr std::chrono::milliseconds kDefaultLinkCacheTtl = std::chrono::hours(12);
inline constexpr const char*               kLinkKeyPrefix       = "link:";

struct ResolutionOptions {
  std::chrono::milliseconds ttl = kDefaultLinkCacheTtl;
};

/*
  Cache-aside lookup of links by short code.

  Consistency model:
  - A hit is served from the cache tier without touching the store.
  - A miss reads the store and populates "link:<code>" for ttl.
  - Store misses are not cached; a code created after a failed lookup
    resolves on the next call.
  - Links are immutable, so a cached entry never goes stale; the ttl only
    bounds cache occupancy.

  Errors:
    util::InvalidArgument        malformed short code
    util::NotFound               no such link
    util::DependencyUnavailable  cache tier or store failed
*/
class ResolutionCache {
 public:
  ResolutionCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::CacheStore> cache, ResolutionOptions options = {});

  db::model::LinkRecord Resolve(const std::string& short_code);

  static std::string Key(const std::string& short_code);

 private:
  std::optional<std::string>           Fetch(const std::string& short_code);
  std::optional<db::model::LinkRecord> Lookup(const std::string& short_code);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<cache::CacheStore> cache_;
  ResolutionOptions                  options_;
};

} // namespace shortener::core
