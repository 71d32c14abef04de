#include "application.hpp"

#include "internal/grpc/task_server.hpp"

namespace finq::factory {

Application Build(const finq::runtime::config::RuntimeConfig& config) {
  Application app;
  app.runtime = BuildRuntime(config);

  app.grpc_services.push_back(std::make_unique<grpc::TaskServer>(app.runtime.task_service));

  return app;
}

} // namespace finq::factory
