#include "factory.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "internal/executor/thread_per_task_executor.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace finq::factory {

using finq::runtime::config::ExecutorKind;

std::shared_ptr<executor::Executor> BuildExecutor(const finq::runtime::config::ExecutorConfig& config) {
  switch (config.kind()) {
    case ExecutorKind::EXECUTOR_KIND_UNSPECIFIED:
    case ExecutorKind::EXECUTOR_KIND_WORKER_POOL: {
      auto pool = std::make_shared<executor::WorkerPool>(config.workers());
      FINQ_LOG_INFO("executor configured", {observability::StringField("kind", "worker_pool"),
                                            observability::IntField("workers", static_cast<std::int64_t>(pool->WorkerCount()))});
      return pool;
    }
    case ExecutorKind::EXECUTOR_KIND_THREAD_PER_TASK:
      FINQ_LOG_INFO("executor configured", {observability::StringField("kind", "thread_per_task")});
      return std::make_shared<executor::ThreadPerTaskExecutor>();
    default:
      throw std::runtime_error("unsupported executor kind");
  }
}

Runtime BuildRuntime(const finq::runtime::config::RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Queue
  // ------------------------------------------------------------------
  const auto& queue_config = config.queue();

  queue::QueueOptions options;
  if (queue_config.has_default_max_age()) {
    options.default_max_age = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(queue_config.default_max_age()));
  }

  rt.executor = BuildExecutor(queue_config.executor());
  rt.queue    = std::make_shared<queue::TaskQueue>(rt.executor, options);

  // ------------------------------------------------------------------
  // Operations + service
  // ------------------------------------------------------------------
  rt.operations = std::make_shared<service::OperationRegistry>();
  service::RegisterBuiltinOperations(*rt.operations);

  service::ServiceContext ctx;
  ctx.queue      = rt.queue;
  ctx.operations = rt.operations;

  rt.task_service = std::make_shared<service::TaskService>(ctx);

  // ------------------------------------------------------------------
  // Background cleanup
  // ------------------------------------------------------------------
  const auto sweep_interval = queue_config.has_sweep_interval() ? util::FromProto(queue_config.sweep_interval()) : std::chrono::milliseconds{0};

  rt.sweeper = std::make_shared<queue::CleanupSweeper>(rt.queue, sweep_interval, options.default_max_age);
  rt.sweeper->Start();

  return rt;
}

} // namespace finq::factory
