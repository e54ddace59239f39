#pragma once

#include "service_context.hpp"
#include "shortener/v1/admin_service.pb.h"

namespace shortener::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  shortener::v1::StatsResponse
  Stats(const shortener::v1::StatsRequest& req);

  // Never throws; failures are reported as serving=false.
  shortener::v1::HealthResponse
  Health(const shortener::v1::HealthRequest& req);

  shortener::v1::ResetCacheResponse
  ResetCache(const shortener::v1::ResetCacheRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace shortener::service
