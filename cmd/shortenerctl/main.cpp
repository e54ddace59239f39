#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "api/shortener/v1.hpp"
#include "internal/util/time.hpp"

using namespace shortener::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  shortenerctl <addr> encode <original_url>\n"
            << "  shortenerctl <addr> decode <short_code>\n"
            << "  shortenerctl <addr> resolve <short_code>\n"
            << "  shortenerctl <addr> stats\n"
            << "  shortenerctl <addr> health\n"
            << "  shortenerctl <addr> reset-cache\n";
}

static void PrintLink(const Link& link) {
  std::cout << "id=" << link.id() << "\n"
            << "short_code=" << link.short_code() << "\n"
            << "shortened_url=" << link.shortened_url() << "\n"
            << "original_url=" << link.original_url() << "\n"
            << "created_at_ms=" << shortener::util::ToUnixMillis(shortener::util::FromProto(link.created_at())) << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto link_stub  = LinkService::NewStub(channel);
  auto admin_stub = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "encode") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    EncodeRequest req;
    req.set_original_url(argv[3]);

    EncodeResponse resp;

    auto status = link_stub->Encode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintLink(resp.link());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "decode") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    DecodeRequest req;
    req.set_short_code(argv[3]);

    DecodeResponse resp;

    auto status = link_stub->Decode(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintLink(resp.link());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ResolveRequest req;
    req.set_short_code(argv[3]);

    ResolveResponse resp;

    auto status = link_stub->Resolve(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.original_url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "links=" << resp.link_count() << "\n"
              << "counter=" << resp.counter_value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    HealthRequest  req;
    HealthResponse resp;

    auto status = admin_stub->Health(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.serving() ? "serving" : "not serving") << ": " << resp.detail() << "\n";
    return resp.serving() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "reset-cache") {
    ResetCacheRequest  req;
    ResetCacheResponse resp;

    auto status = admin_stub->ResetCache(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "counter=" << resp.counter_value() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
