#pragma once

#include "internal/db/model/link_record.hpp"
#include "service_context.hpp"
#include "shortener/v1/link_service.pb.h"

namespace shortener::service {

/*
  Encode / Decode / Resolve over the core components.

  Exceptions from the core propagate unchanged; the gRPC adapter maps them
  to status codes.
*/
class LinkService {
 public:
  explicit LinkService(ServiceContext ctx);

  shortener::v1::EncodeResponse
  Encode(const shortener::v1::EncodeRequest& req);

  shortener::v1::DecodeResponse
  Decode(const shortener::v1::DecodeRequest& req);

  shortener::v1::ResolveResponse
  Resolve(const shortener::v1::ResolveRequest& req);

 private:
  shortener::v1::Link ToView(const shortener::db::model::LinkRecord& record) const;

  ServiceContext ctx_;
};

} // namespace shortener::service
