#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace shortener::factory {

/*
  Application

  Everything the server process needs, fully wired.
  The gRPC services own the rest of the graph through shared pointers.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config and initializes the
  counter.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store and cache types.
*/
Application Build(const shortener::runtime::config::RuntimeConfig& config);

} // namespace shortener::factory
