#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "shortener/v1/link_service.grpc.pb.h"
#include "internal/service/link_service.hpp"

namespace shortener::grpc {

class LinkServer final : public shortener::v1::LinkService::Service {
 public:
  explicit LinkServer(std::shared_ptr<shortener::service::LinkService> svc);

  ::grpc::Status Encode(::grpc::ServerContext*,
                        const shortener::v1::EncodeRequest*,
                        shortener::v1::EncodeResponse*) override;

  ::grpc::Status Decode(::grpc::ServerContext*,
                        const shortener::v1::DecodeRequest*,
                        shortener::v1::DecodeResponse*) override;

  ::grpc::Status Resolve(::grpc::ServerContext*,
                         const shortener::v1::ResolveRequest*,
                         shortener::v1::ResolveResponse*) override;

 private:
  std::shared_ptr<shortener::service::LinkService> service_;
};

} // namespace shortener::grpc
