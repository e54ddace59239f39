#include "resolution_cache.hpp"

#include <stdexcept>

#include "internal/cache/cache_store.hpp"
#include "internal/core/link_mapping.hpp"
#include "internal/core/link_validation.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::core {

using shortener::observability::StringField;

ResolutionCache::ResolutionCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::CacheStore> cache, ResolutionOptions options)
    : repository_(std::move(repository)), cache_(std::move(cache)), options_(options) {
  if (!repository_ || !cache_) {
    throw std::invalid_argument("ResolutionCache requires a repository and a cache store");
  }
}

std::string ResolutionCache::Key(const std::string& short_code) {
  return kLinkKeyPrefix + short_code;
}

db::model::LinkRecord ResolutionCache::Resolve(const std::string& short_code) {
  ValidateShortCode(short_code);

  auto entry = Fetch(short_code);
  if (!entry) {
    throw util::NotFound("Couldn't find Link with short_code=" + short_code);
  }

  shortener::v1::Link link;
  if (link.ParseFromString(*entry)) {
    return FromProto(link);
  }

  // Entry written by something else: drop it and go back to the store.
  SHORTENER_LOG_WARN("discarding undecodable cache entry", {StringField("key", Key(short_code))});
  cache_->Delete(Key(short_code));

  entry = Fetch(short_code);
  if (!entry) {
    throw util::NotFound("Couldn't find Link with short_code=" + short_code);
  }
  if (!link.ParseFromString(*entry)) {
    throw util::DependencyUnavailable("cache returned an undecodable link for " + short_code);
  }
  return FromProto(link);
}

std::optional<std::string> ResolutionCache::Fetch(const std::string& short_code) {
  return cache_->FetchOrCompute(Key(short_code), options_.ttl, [&]() -> std::optional<std::string> {
    auto record = Lookup(short_code);
    if (!record) return std::nullopt;
    return ToProto(*record).SerializeAsString();
  });
}

std::optional<db::model::LinkRecord> ResolutionCache::Lookup(const std::string& short_code) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->FindLinkByShortCode(*tx, short_code);
    tx->Commit();
    return record;
  } catch (const std::exception& e) {
    throw util::DependencyUnavailable("link lookup failed: " + std::string(e.what()));
  }
}

} // namespace shortener::core
