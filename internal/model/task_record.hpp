#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/struct.pb.h"
#include "internal/util/time.hpp"

namespace finq::model {

enum class TaskStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kCompleted = 2,
  kFailed    = 3,
};

// Lower-case wire names: "pending", "running", "completed", "failed".
const char*               StatusName(TaskStatus status);
std::optional<TaskStatus> ParseStatus(const std::string& name);

struct TaskError {
  std::string error_type;
  std::string error_message;
  std::string traceback;
};

/*
  One submitted unit of work and its lifecycle state.

  result is set only when Completed, error only when Failed.
*/
struct TaskRecord {
  TaskRecord() = default;
  TaskRecord(std::string task_id, std::string function_name, util::TimePoint created);

  std::string task_id;
  TaskStatus  status = TaskStatus::kPending;
  std::string function_name;

  std::optional<google::protobuf::Value> result;
  std::optional<TaskError>               error;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
};

} // namespace finq::model
