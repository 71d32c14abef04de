#include "task_wire.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/queue/operation.hpp"

namespace finq::service {

finq::v1::TaskRecord ToProto(const model::TaskRecord& record) {
  finq::v1::TaskRecord out;
  out.set_task_id(record.task_id);
  out.set_status(model::StatusName(record.status));
  out.set_function_name(record.function_name);

  *out.mutable_result() = record.result ? *record.result : queue::NullValue();

  if (record.error) {
    auto* error = out.mutable_error();
    error->set_error_type(record.error->error_type);
    error->set_error_message(record.error->error_message);
    error->set_traceback(record.error->traceback);
  }

  out.set_created_at(util::ToIso8601(record.created_at));
  *out.mutable_started_at()   = record.started_at ? queue::StringValue(util::ToIso8601(*record.started_at)) : queue::NullValue();
  *out.mutable_completed_at() = record.completed_at ? queue::StringValue(util::ToIso8601(*record.completed_at)) : queue::NullValue();
  return out;
}

finq::v1::QueueStatsResponse ToProto(const queue::QueueStats& stats) {
  finq::v1::QueueStatsResponse out;
  out.set_total(stats.total);
  out.set_pending(stats.pending);
  out.set_running(stats.running);
  out.set_completed(stats.completed);
  out.set_failed(stats.failed);
  return out;
}

finq::v1::TaskStatus ToProto(model::TaskStatus status) {
  switch (status) {
    case model::TaskStatus::kPending:
      return finq::v1::TASK_STATUS_PENDING;
    case model::TaskStatus::kRunning:
      return finq::v1::TASK_STATUS_RUNNING;
    case model::TaskStatus::kCompleted:
      return finq::v1::TASK_STATUS_COMPLETED;
    case model::TaskStatus::kFailed:
      return finq::v1::TASK_STATUS_FAILED;
  }
  return finq::v1::TASK_STATUS_UNSPECIFIED;
}

std::optional<model::TaskStatus> FromProto(finq::v1::TaskStatus status) {
  switch (status) {
    case finq::v1::TASK_STATUS_PENDING:
      return model::TaskStatus::kPending;
    case finq::v1::TASK_STATUS_RUNNING:
      return model::TaskStatus::kRunning;
    case finq::v1::TASK_STATUS_COMPLETED:
      return model::TaskStatus::kCompleted;
    case finq::v1::TASK_STATUS_FAILED:
      return model::TaskStatus::kFailed;
    default:
      return std::nullopt;
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize message to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace finq::service
