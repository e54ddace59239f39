#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_store.hpp"
#include "internal/cache/memory/memory_cache.hpp"
#include "internal/core/code_generator.hpp"
#include "internal/core/link_mapping.hpp"
#include "internal/core/resolution_cache.hpp"
#include "internal/counter/counter_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/link_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/link_service.hpp"
#include "internal/service/service_context.hpp"
#if SHORTENER_DB_SQLITE
#include "internal/cache/sqlite/sqlite_cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SHORTENER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace shortener::factory {

using namespace shortener;
using shortener::runtime::config::RuntimeConfig;

namespace {

// Open SQLite files, one connection per path so a store and cache sharing
// a file share the connection too.
struct SqliteFiles {
#if SHORTENER_DB_SQLITE
  std::map<std::string, std::shared_ptr<db::sqlite::SqliteDB>> open;

  std::shared_ptr<db::sqlite::SqliteDB> Open(const std::string& path) {
    auto& slot = open[path];
    if (!slot) {
      slot = std::make_shared<db::sqlite::SqliteDB>(path);
    }
    return slot;
  }
#endif
};

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config, [[maybe_unused]] SqliteFiles& sqlite_files) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SHORTENER_DB_SQLITE
    auto sqlite_db = sqlite_files.Open(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    SHORTENER_LOG_INFO("Link store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SHORTENER_DB_POSTGRES
    const auto& pg              = database.postgres();
    const auto  max_connections = pg.max_connections() > 0 ? pg.max_connections() : 16;
    auto        pool            = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    SHORTENER_LOG_INFO("Link store ready", {observability::StringField("backend", "postgres"), observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SHORTENER_LOG_WARN("Link store is in-memory; links are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<cache::CacheStore> BuildCache(const RuntimeConfig& config, [[maybe_unused]] SqliteFiles& sqlite_files) {
  const auto& cache_config = config.cache();
  if (cache_config.has_sqlite()) {
#if SHORTENER_DB_SQLITE
    auto sqlite_db = sqlite_files.Open(cache_config.sqlite().path());
    SHORTENER_LOG_INFO("Cache tier ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", cache_config.sqlite().path())});
    return std::make_shared<cache::sqlite::SqliteCache>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite cache requested but not enabled at build time");
#endif
  }

  SHORTENER_LOG_INFO("Cache tier ready", {observability::StringField("backend", "memory")});
  return std::make_shared<cache::memory::MemoryCache>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const auto& settings = config.shortener();

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  SqliteFiles sqlite_files;
  auto        repository = BuildRepository(config, sqlite_files);
  auto        cache      = BuildCache(config, sqlite_files);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  counter::CounterOptions counter_options;
  if (settings.initial_counter() > 0) {
    counter_options.initial_value = settings.initial_counter();
  }
  counter_options.auto_initialize = settings.auto_initialize_counter();
  counter_options.issued_floor    = [repository] { return core::HighestIssuedValue(*repository); };
  auto counter                    = std::make_shared<counter::CounterAllocator>(cache, counter_options);

  core::GeneratorOptions generator_options;
  if (settings.max_allocation_attempts() > 0) {
    generator_options.max_attempts = settings.max_allocation_attempts();
  }
  auto generator = std::make_shared<core::CodeGenerator>(repository, counter, generator_options);

  core::ResolutionOptions resolution_options;
  if (settings.has_link_cache_ttl()) {
    const auto& ttl = settings.link_cache_ttl();
    const std::chrono::milliseconds ms =
        std::chrono::seconds(ttl.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(ttl.nanos()));
    if (ms.count() > 0) {
      resolution_options.ttl = ms;
    }
  }
  auto resolver = std::make_shared<core::ResolutionCache>(repository, cache, resolution_options);

  counter->Initialize();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository      = repository;
  ctx.cache           = cache;
  ctx.counter         = counter;
  ctx.generator       = generator;
  ctx.resolver        = resolver;
  ctx.public_base_url = config.server().public_base_url().empty() ? core::kDefaultPublicBaseUrl : config.server().public_base_url();

  auto link_service  = std::make_shared<service::LinkService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LinkServer>(link_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  SHORTENER_LOG_INFO("Application built", {observability::IntField("counter_value", counter->Current().value_or(0)),
                                          observability::StringField("public_base_url", ctx.public_base_url),
                                          observability::IntField("max_allocation_attempts", generator_options.max_attempts)});

  return app;
}

} // namespace shortener::factory
