#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/executor/executor.hpp"
#include "internal/model/task_record.hpp"
#include "internal/queue/operation.hpp"
#include "internal/queue/task_runner.hpp"
#include "internal/queue/task_store.hpp"
#include "internal/util/time.hpp"

namespace finq::queue {

struct QueueOptions {
  // Used by Clean() without an explicit age.
  std::chrono::seconds default_max_age{3600};

  util::ClockFn clock = util::Now;
};

/*
  Public surface of the background task queue.

  Submit() returns as soon as the task is recorded and handed to the
  executor. Callers then poll GetStatus() until the task is terminal.
  Finished tasks stay until Clean() drops them.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::shared_ptr<executor::Executor> executor, QueueOptions options = {});
  ~TaskQueue();

  TaskQueue(const TaskQueue&)            = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  std::string Submit(Operation operation, std::string name);

  // Throws util::NotFound for ids never issued or already cleaned.
  model::TaskRecord GetStatus(const std::string& task_id) const;

  std::vector<model::TaskRecord> List(std::optional<model::TaskStatus> status_filter = std::nullopt) const;

  // Drops Completed/Failed tasks that finished more than max_age ago.
  std::size_t Clean(std::chrono::seconds max_age);
  std::size_t Clean();

  QueueStats Stats() const;

  // Refuses new work and waits for accepted work to finish.
  void Shutdown();

  std::chrono::seconds DefaultMaxAge() const {
    return default_max_age_;
  }

 private:
  std::shared_ptr<TaskStore>          store_;
  util::ClockFn                       clock_;
  TaskRunner                          runner_;
  std::shared_ptr<executor::Executor> executor_;
  std::chrono::seconds                default_max_age_;
};

} // namespace finq::queue
