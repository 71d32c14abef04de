#pragma once

#include <memory>
#include <string>

#include "internal/model/task_record.hpp"
#include "internal/queue/operation.hpp"
#include "internal/queue/task_store.hpp"
#include "internal/util/time.hpp"

namespace finq::queue {

/*
  Drives one task through Pending -> Running -> Completed | Failed.

  Execute() never throws: whatever the operation does ends up in the
  task record. It is the only writer of status, result, error and the
  start/finish timestamps.
*/
class TaskRunner {
 public:
  TaskRunner(std::shared_ptr<TaskStore> store, util::ClockFn clock);

  void Execute(const std::string& task_id, const Operation& operation) const;

  // The executor refused the task: record it as failed at the time of the attempt.
  void FailToStart(const std::string& task_id, model::TaskError error) const;

 private:
  void Finish(const std::string& task_id, const std::string& operation_name, OperationResult outcome, double duration_ms) const;

  std::shared_ptr<TaskStore> store_;
  util::ClockFn              clock_;
};

} // namespace finq::queue
