#include "internal/model/task_record.hpp"

#include <utility>

namespace finq::model {

const char* StatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<TaskStatus> ParseStatus(const std::string& name) {
  if (name == "pending") return TaskStatus::kPending;
  if (name == "running") return TaskStatus::kRunning;
  if (name == "completed") return TaskStatus::kCompleted;
  if (name == "failed") return TaskStatus::kFailed;
  return std::nullopt;
}

TaskRecord::TaskRecord(std::string id, std::string name, util::TimePoint created)
    : task_id(std::move(id)), function_name(std::move(name)), created_at(created) {
}

} // namespace finq::model
