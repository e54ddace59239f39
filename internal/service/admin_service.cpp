#include "admin_service.hpp"

#include <string>

#include "internal/cache/cache_store.hpp"
#include "internal/counter/counter_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "rpc_logging.hpp"

namespace shortener::service {

using namespace shortener::v1;

namespace {

constexpr const char* kHealthProbeKey = "health:probe";

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return RunLogged("AdminService.Stats", [&] {
    StatsResponse resp;

    auto tx = ctx_.repository->Begin();
    resp.set_link_count(ctx_.repository->CountLinks(*tx));
    tx->Commit();

    resp.set_counter_value(ctx_.counter->Current().value_or(0));
    return resp;
  });
}

HealthResponse AdminService::Health(const HealthRequest&) {
  HealthResponse resp;

  try {
    auto tx = ctx_.repository->Begin();
    ctx_.repository->CountLinks(*tx);
    tx->Commit();
  } catch (const std::exception& ex) {
    SHORTENER_LOG_WARN("Health check failed", {observability::StringField("component", "store"), observability::StringField("error", ex.what())});
    resp.set_serving(false);
    resp.set_detail(std::string("store: ") + ex.what());
    return resp;
  }

  try {
    ctx_.cache->Exists(kHealthProbeKey);
  } catch (const std::exception& ex) {
    SHORTENER_LOG_WARN("Health check failed", {observability::StringField("component", "cache"), observability::StringField("error", ex.what())});
    resp.set_serving(false);
    resp.set_detail(std::string("cache: ") + ex.what());
    return resp;
  }

  resp.set_serving(true);
  resp.set_detail("ok");
  return resp;
}

ResetCacheResponse AdminService::ResetCache(const ResetCacheRequest&) {
  return RunLogged("AdminService.ResetCache", [&] {
    ctx_.cache->Clear();
    ctx_.counter->Initialize();

    const auto counter_value = ctx_.counter->Current().value_or(0);
    SHORTENER_LOG_WARN("Cache tier cleared; counter re-initialized", {observability::IntField("counter_value", counter_value)});

    ResetCacheResponse resp;
    resp.set_counter_value(counter_value);
    return resp;
  });
}

} // namespace shortener::service
