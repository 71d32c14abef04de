#include "internal/queue/task_runner.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/exceptions.hpp"

namespace finq::queue {

using model::TaskStatus;
using observability::StringField;

TaskRunner::TaskRunner(std::shared_ptr<TaskStore> store, util::ClockFn clock) : store_(std::move(store)), clock_(std::move(clock)) {
}

void TaskRunner::Execute(const std::string& task_id, const Operation& operation) const {
  observability::SpanScope span("TaskRunner.Execute");
  span.SetAttribute("task_id", task_id);

  std::string operation_name;
  bool        started = false;

  const bool present = store_->Update(task_id, [&](model::TaskRecord& record) {
    if (!model::CanTransition(record.status, TaskStatus::kRunning)) {
      return;
    }
    record.status     = TaskStatus::kRunning;
    record.started_at = std::max(clock_(), record.created_at);
    operation_name    = record.function_name;
    started           = true;
  });

  if (!present) {
    FINQ_LOG_WARN("task vanished before execution", {StringField("task_id", task_id)});
    return;
  }
  if (!started) {
    FINQ_LOG_WARN("task scheduled twice; ignoring", {StringField("task_id", task_id)});
    return;
  }

  span.SetAttribute("operation", operation_name);
  FINQ_LOG_INFO("task started", {StringField("task_id", task_id), StringField("operation", operation_name)});

  const auto      began = std::chrono::steady_clock::now();
  OperationResult outcome;
  try {
    outcome = operation();
  } catch (...) {
    outcome.value.reset();
    outcome.error = util::DescribeException(std::current_exception());
  }
  const double duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - began).count();

  if (outcome.error) {
    span.RecordException(outcome.error->error_message);
  }
  Finish(task_id, operation_name, std::move(outcome), duration_ms);
}

void TaskRunner::FailToStart(const std::string& task_id, model::TaskError error) const {
  if (error.traceback.empty()) {
    error.traceback = util::SingleFrameTraceback(error.error_type, error.error_message);
  }
  std::string operation_name;
  store_->Update(task_id, [&](model::TaskRecord& record) {
    if (record.status != TaskStatus::kPending) {
      return;
    }
    const auto at       = std::max(clock_(), record.created_at);
    record.status       = TaskStatus::kFailed;
    record.error        = error;
    record.started_at   = at;
    record.completed_at = at;
    operation_name      = record.function_name;
  });

  FINQ_LOG_ERROR("task could not be started",
                 {StringField("task_id", task_id), StringField("operation", operation_name), StringField("error", error.error_message)});
  observability::Metrics::Instance().RecordTask(operation_name, model::StatusName(TaskStatus::kFailed));
}

void TaskRunner::Finish(const std::string& task_id, const std::string& operation_name, OperationResult outcome, double duration_ms) const {
  const bool failed = outcome.error.has_value();
  if (failed && outcome.error->traceback.empty()) {
    outcome.error->traceback = util::SingleFrameTraceback(outcome.error->error_type, outcome.error->error_message);
  }
  const auto target = failed ? TaskStatus::kFailed : TaskStatus::kCompleted;
  const auto reason = failed ? outcome.error->error_type + ": " + outcome.error->error_message : std::string();

  bool finished = false;
  store_->Update(task_id, [&](model::TaskRecord& record) {
    if (!model::CanTransition(record.status, target)) {
      return;
    }
    record.status       = target;
    record.completed_at = std::max(clock_(), record.started_at.value_or(record.created_at));
    if (failed) {
      record.error = std::move(outcome.error);
    } else {
      record.result = outcome.value ? std::move(outcome.value) : NullValue();
    }
    finished = true;
  });

  if (!finished) {
    FINQ_LOG_WARN("task outcome dropped", {StringField("task_id", task_id), StringField("operation", operation_name)});
    return;
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordTask(operation_name, model::StatusName(target));
  metrics.ObserveTaskDurationMs(operation_name, duration_ms);

  if (failed) {
    FINQ_LOG_ERROR("task failed", {StringField("task_id", task_id), StringField("operation", operation_name), StringField("error", reason),
                                   observability::DoubleField("duration_ms", duration_ms)});
    return;
  }
  FINQ_LOG_INFO("task completed", {StringField("task_id", task_id), StringField("operation", operation_name),
                                   observability::DoubleField("duration_ms", duration_ms)});
}

} // namespace finq::queue
