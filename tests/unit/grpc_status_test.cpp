#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "api/shortener/v1.hpp"
#include "internal/cache/memory/memory_cache.hpp"
#include "internal/codec/base62.hpp"
#include "internal/core/code_generator.hpp"
#include "internal/core/resolution_cache.hpp"
#include "internal/counter/counter_allocator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/link_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/link_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

using namespace shortener::v1;

shortener::service::ServiceContext BuildServiceContext(bool initialize_counter = true) {
  shortener::service::ServiceContext ctx;
  ctx.repository = std::make_shared<shortener::db::memory::MemoryRepository>();
  ctx.cache      = std::make_shared<shortener::cache::memory::MemoryCache>();

  shortener::counter::CounterOptions counter_options;
  counter_options.issued_floor = [repository = ctx.repository] { return shortener::core::HighestIssuedValue(*repository); };
  ctx.counter                  = std::make_shared<shortener::counter::CounterAllocator>(ctx.cache, counter_options);
  ctx.generator  = std::make_shared<shortener::core::CodeGenerator>(ctx.repository, ctx.counter);
  ctx.resolver   = std::make_shared<shortener::core::ResolutionCache>(ctx.repository, ctx.cache);
  if (initialize_counter) ctx.counter->Initialize();
  return ctx;
}

::grpc::Status Encode(shortener::grpc::LinkServer& server, const std::string& url, EncodeResponse* resp) {
  EncodeRequest req;
  req.set_original_url(url);
  ::grpc::ServerContext grpc_ctx;
  return server.Encode(&grpc_ctx, &req, resp);
}

void TestExceptionMapping() {
  using namespace shortener::util;

  assert(shortener::grpc::ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(shortener::grpc::ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(shortener::grpc::ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(shortener::grpc::ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(shortener::grpc::ToStatus(DependencyUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(shortener::grpc::ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(shortener::grpc::ToStatus(NotFound("missing link")).error_message() == "missing link");
}

void TestEncodeReturnsShortenedUrl() {
  auto ctx = BuildServiceContext();
  ctx.public_base_url = "https://sho.rt/";
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  EncodeResponse resp;
  const auto     status = Encode(server, "https://example.com/some/long/path", &resp);
  assert(status.ok());
  assert(resp.link().short_code() == "OGsBFv");
  assert(resp.link().shortened_url() == "https://sho.rt/OGsBFv");
  assert(resp.link().original_url() == "https://example.com/some/long/path");
  assert(resp.link().id() > 0);
  assert(resp.link().has_created_at());
}

void TestDefaultPublicBaseUrl() {
  auto ctx = BuildServiceContext();
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  EncodeResponse resp;
  assert(Encode(server, "https://example.com", &resp).ok());
  assert(resp.link().shortened_url() == "http://localhost:3000/" + resp.link().short_code());
}

void TestEncodeBlankUrlReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  EncodeResponse resp;
  auto           status = Encode(server, "", &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "Original url can't be blank");

  status = Encode(server, "notaurl", &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "Original url must be a valid URL");
}

void TestEncodeWithoutCounterReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext(false);
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  EncodeResponse resp;
  assert(Encode(server, "https://example.com", &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestDecodeAndResolve() {
  auto ctx = BuildServiceContext();
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  EncodeResponse encoded;
  assert(Encode(server, "https://example.com/target", &encoded).ok());

  DecodeRequest decode_req;
  decode_req.set_short_code(encoded.link().short_code());
  DecodeResponse        decode_resp;
  ::grpc::ServerContext decode_ctx;
  assert(server.Decode(&decode_ctx, &decode_req, &decode_resp).ok());
  assert(decode_resp.link().id() == encoded.link().id());
  assert(decode_resp.link().original_url() == "https://example.com/target");
  assert(decode_resp.link().shortened_url() == encoded.link().shortened_url());
  assert(decode_resp.link().created_at().seconds() == encoded.link().created_at().seconds());

  ResolveRequest resolve_req;
  resolve_req.set_short_code(encoded.link().short_code());
  ResolveResponse       resolve_resp;
  ::grpc::ServerContext resolve_ctx;
  assert(server.Resolve(&resolve_ctx, &resolve_req, &resolve_resp).ok());
  assert(resolve_resp.original_url() == "https://example.com/target");
}

void TestDecodeUnknownCodeReturnsNotFound() {
  auto ctx = BuildServiceContext();
  shortener::grpc::LinkServer server(std::make_shared<shortener::service::LinkService>(ctx));

  DecodeRequest req;
  req.set_short_code("YYYYYY");
  DecodeResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.Decode(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_short_code("bad");
  ::grpc::ServerContext malformed_ctx;
  assert(server.Decode(&malformed_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestAdminStatsHealthAndReset() {
  auto ctx = BuildServiceContext();
  shortener::grpc::LinkServer  links(std::make_shared<shortener::service::LinkService>(ctx));
  shortener::grpc::AdminServer admin(std::make_shared<shortener::service::AdminService>(ctx));

  // more links than one Encode call has attempts
  constexpr int  kIssued = 12;
  EncodeResponse encoded;
  for (int i = 1; i <= kIssued; ++i) {
    assert(Encode(links, "https://example.com/" + std::to_string(i), &encoded).ok());
  }

  StatsRequest          stats_req;
  StatsResponse         stats_resp;
  ::grpc::ServerContext stats_ctx;
  assert(admin.Stats(&stats_ctx, &stats_req, &stats_resp).ok());
  assert(stats_resp.link_count() == kIssued);
  assert(stats_resp.counter_value() == 1'000'000'000 + kIssued);

  HealthRequest         health_req;
  HealthResponse        health_resp;
  ::grpc::ServerContext health_ctx;
  assert(admin.Health(&health_ctx, &health_req, &health_resp).ok());
  assert(health_resp.serving());

  // warm the resolution cache, then reset
  DecodeRequest decode_req;
  decode_req.set_short_code(encoded.link().short_code());
  DecodeResponse        decode_resp;
  ::grpc::ServerContext decode_ctx;
  assert(links.Decode(&decode_ctx, &decode_req, &decode_resp).ok());
  assert(ctx.cache->Exists("link:" + encoded.link().short_code()));

  ResetCacheRequest     reset_req;
  ResetCacheResponse    reset_resp;
  ::grpc::ServerContext reset_ctx;
  assert(admin.ResetCache(&reset_ctx, &reset_req, &reset_resp).ok());
  assert(reset_resp.counter_value() == 1'000'000'000 + kIssued);
  assert(!ctx.cache->Exists("link:" + encoded.link().short_code()));

  // links survive in the store
  ::grpc::ServerContext after_ctx;
  assert(links.Decode(&after_ctx, &decode_req, &decode_resp).ok());

  // the counter resumes past every issued code, so nothing collides
  for (int i = 1; i <= 3; ++i) {
    EncodeResponse after_reset;
    assert(Encode(links, "https://example.com/after/" + std::to_string(i), &after_reset).ok());
    assert(after_reset.link().short_code() == *shortener::codec::Encode(1'000'000'000 + kIssued + i));
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestEncodeReturnsShortenedUrl();
  TestDefaultPublicBaseUrl();
  TestEncodeBlankUrlReturnsInvalidArgument();
  TestEncodeWithoutCounterReturnsFailedPrecondition();
  TestDecodeAndResolve();
  TestDecodeUnknownCodeReturnsNotFound();
  TestAdminStatsHealthAndReset();

  std::cout << "shortener_unit_grpc_status: pass\n";
  return 0;
}
