#include "internal/queue/task_queue.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/exceptions.hpp"
#include "internal/util/uuid.hpp"

namespace finq::queue {

using observability::StringField;

TaskQueue::TaskQueue(std::shared_ptr<executor::Executor> executor, QueueOptions options)
    : store_(std::make_shared<TaskStore>()),
      clock_(options.clock ? std::move(options.clock) : util::ClockFn(util::Now)),
      runner_(store_, clock_),
      executor_(std::move(executor)),
      default_max_age_(options.default_max_age) {
  if (!executor_) {
    throw util::InvalidArgument("task queue requires an executor");
  }
}

TaskQueue::~TaskQueue() {
  Shutdown();
}

std::string TaskQueue::Submit(Operation operation, std::string name) {
  auto task_id = util::GenerateUUIDString();
  if (name.empty()) name = "unknown";

  store_->Insert(model::TaskRecord(task_id, name, clock_()));

  try {
    executor_->Post([runner = runner_, task_id, operation = std::move(operation)] { runner.Execute(task_id, operation); });
  } catch (const std::exception&) {
    auto error       = util::DescribeException(std::current_exception());
    error.error_type = "ExecutorUnavailable";
    runner_.FailToStart(task_id, std::move(error));
    return task_id;
  }

  observability::Metrics::Instance().RecordTask(name, "submitted");
  FINQ_LOG_INFO("task added to queue", {StringField("task_id", task_id), StringField("operation", name)});
  return task_id;
}

model::TaskRecord TaskQueue::GetStatus(const std::string& task_id) const {
  auto record = store_->Get(task_id);
  if (!record) {
    throw util::NotFound("task " + task_id + " not found in queue");
  }
  return std::move(*record);
}

std::vector<model::TaskRecord> TaskQueue::List(std::optional<model::TaskStatus> status_filter) const {
  if (!status_filter) {
    return store_->List();
  }

  const auto wanted = *status_filter;
  return store_->List([wanted](const model::TaskRecord& record) { return record.status == wanted; });
}

std::size_t TaskQueue::Clean(std::chrono::seconds max_age) {
  // Ages past the clock's range cannot be expressed in clock ticks; nothing is that old.
  if (max_age >= std::chrono::duration_cast<std::chrono::seconds>(util::Clock::duration::max())) {
    return 0;
  }

  const auto now = clock_();

  const auto removed = store_->DeleteWhere([&](const model::TaskRecord& record) {
    if (!model::IsTerminal(record.status) || !record.completed_at) {
      return false;
    }
    return now - *record.completed_at > max_age;
  });

  if (removed > 0) {
    FINQ_LOG_INFO("cleared old tasks from queue",
                  {observability::IntField("removed", static_cast<std::int64_t>(removed)), observability::IntField("max_age_s", max_age.count())});
  }
  return removed;
}

std::size_t TaskQueue::Clean() {
  return Clean(default_max_age_);
}

QueueStats TaskQueue::Stats() const {
  const auto stats = store_->Census();

  auto& metrics = observability::Metrics::Instance();
  metrics.SetTasksInQueue(model::StatusName(model::TaskStatus::kPending), stats.pending);
  metrics.SetTasksInQueue(model::StatusName(model::TaskStatus::kRunning), stats.running);
  metrics.SetTasksInQueue(model::StatusName(model::TaskStatus::kCompleted), stats.completed);
  metrics.SetTasksInQueue(model::StatusName(model::TaskStatus::kFailed), stats.failed);
  return stats;
}

void TaskQueue::Shutdown() {
  executor_->Shutdown();
}

} // namespace finq::queue
