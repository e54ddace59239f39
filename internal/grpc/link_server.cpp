#include "link_server.hpp"

#include "grpc_error.hpp"

namespace shortener::grpc {

using namespace shortener::v1;

LinkServer::LinkServer(std::shared_ptr<shortener::service::LinkService> svc) : service_(std::move(svc)) {
}

::grpc::Status LinkServer::Encode(::grpc::ServerContext*, const EncodeRequest* req, EncodeResponse* resp) {
  try {
    *resp = service_->Encode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LinkServer::Decode(::grpc::ServerContext*, const DecodeRequest* req, DecodeResponse* resp) {
  try {
    *resp = service_->Decode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LinkServer::Resolve(::grpc::ServerContext*, const ResolveRequest* req, ResolveResponse* resp) {
  try {
    *resp = service_->Resolve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shortener::grpc
