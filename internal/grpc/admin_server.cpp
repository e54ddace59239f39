#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace shortener::grpc {

using namespace shortener::v1;

AdminServer::AdminServer(std::shared_ptr<shortener::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  *resp = service_->Health(*req);
  return ::grpc::Status::OK;
}

::grpc::Status AdminServer::ResetCache(::grpc::ServerContext*, const ResetCacheRequest* req, ResetCacheResponse* resp) {
  try {
    *resp = service_->ResetCache(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shortener::grpc
