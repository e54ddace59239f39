#pragma once

#include <memory>
#include <string>

namespace shortener::db { class Repository; }
namespace shortener::cache { class CacheStore; }
namespace shortener::counter { class CounterAllocator; }
namespace shortener::core { class CodeGenerator; class ResolutionCache; }

namespace shortener::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<shortener::db::Repository> repository;
  std::shared_ptr<shortener::cache::CacheStore> cache;
  std::shared_ptr<shortener::counter::CounterAllocator> counter;
  std::shared_ptr<shortener::core::CodeGenerator> generator;
  std::shared_ptr<shortener::core::ResolutionCache> resolver;

  // Prefix of Link.shortened_url.
  std::string public_base_url;
};

} // namespace shortener::service
