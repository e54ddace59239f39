#include "link_service.hpp"

#include "internal/core/code_generator.hpp"
#include "internal/core/link_mapping.hpp"
#include "internal/core/resolution_cache.hpp"
#include "internal/observability/logging.hpp"
#include "rpc_logging.hpp"

namespace shortener::service {

using namespace shortener::v1;

LinkService::LinkService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (ctx_.public_base_url.empty()) {
    ctx_.public_base_url = core::kDefaultPublicBaseUrl;
  }
}

Link LinkService::ToView(const db::model::LinkRecord& record) const {
  auto link = core::ToProto(record);
  link.set_shortened_url(core::ShortenedUrl(ctx_.public_base_url, record.short_code));
  return link;
}

EncodeResponse LinkService::Encode(const EncodeRequest& req) {
  return RunLogged("LinkService.Encode", [&] {
    const auto record = ctx_.generator->CreateShortenedFor(req.original_url());

    SHORTENER_LOG_INFO("Link created", {observability::StringField("short_code", record.short_code),
                                        observability::IntField("id", record.id)});

    EncodeResponse resp;
    *resp.mutable_link() = ToView(record);
    return resp;
  });
}

DecodeResponse LinkService::Decode(const DecodeRequest& req) {
  return RunLogged("LinkService.Decode", [&] {
    DecodeResponse resp;
    *resp.mutable_link() = ToView(ctx_.resolver->Resolve(req.short_code()));
    return resp;
  });
}

ResolveResponse LinkService::Resolve(const ResolveRequest& req) {
  return RunLogged("LinkService.Resolve", [&] {
    ResolveResponse resp;
    resp.set_original_url(ctx_.resolver->Resolve(req.short_code()).original_url);
    return resp;
  });
}

} // namespace shortener::service
