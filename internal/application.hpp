#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "internal/factory.hpp"

namespace finq::factory {

/*
  Application

  Runtime plus the gRPC adapters the server registers.
*/
struct Application {
  Runtime                                       runtime;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application Build(const finq::runtime::config::RuntimeConfig& config);

} // namespace finq::factory
