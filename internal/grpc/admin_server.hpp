#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "shortener/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace shortener::grpc {

class AdminServer final : public shortener::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<shortener::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const shortener::v1::StatsRequest*,
                       shortener::v1::StatsResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*,
                        const shortener::v1::HealthRequest*,
                        shortener::v1::HealthResponse*) override;

  ::grpc::Status ResetCache(::grpc::ServerContext*,
                            const shortener::v1::ResetCacheRequest*,
                            shortener::v1::ResetCacheResponse*) override;

 private:
  std::shared_ptr<shortener::service::AdminService> service_;
};

} // namespace shortener::grpc
