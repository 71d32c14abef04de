#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/executor/executor.hpp"
#include "internal/queue/cleanup_sweeper.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/service/operation_registry.hpp"
#include "internal/service/task_service.hpp"

namespace finq::factory {

/*
  Runtime

  Owns every long-lived component behind the transport. The sweeper is
  declared last so it is destroyed (and stopped) before the queue.
*/
struct Runtime {
  std::shared_ptr<executor::Executor>         executor;
  std::shared_ptr<queue::TaskQueue>           queue;
  std::shared_ptr<service::OperationRegistry> operations;
  std::shared_ptr<service::TaskService>       task_service;
  std::shared_ptr<queue::CleanupSweeper>      sweeper;
};

std::shared_ptr<executor::Executor> BuildExecutor(const finq::runtime::config::ExecutorConfig& config);

/*
  BuildRuntime

  Composition root: the only place that picks concrete executor types.
  Starts the cleanup sweeper when an interval is configured.
*/
Runtime BuildRuntime(const finq::runtime::config::RuntimeConfig& config);

} // namespace finq::factory
