#pragma once

#include <optional>
#include <string>

#include <google/protobuf/message.h>

#include "finq/v1/task.pb.h"
#include "internal/model/task_record.hpp"
#include "internal/queue/task_store.hpp"

namespace finq::service {

/*
  Conversions between queue records and the finq.v1 wire messages.
*/

finq::v1::TaskRecord         ToProto(const model::TaskRecord& record);
finq::v1::QueueStatsResponse ToProto(const queue::QueueStats& stats);

finq::v1::TaskStatus ToProto(model::TaskStatus status);

// UNSPECIFIED maps to "no filter".
std::optional<model::TaskStatus> FromProto(finq::v1::TaskStatus status);

// JSON with the proto field names (task_id, error_message, ...) and
// every primitive field present.
std::string ToJson(const google::protobuf::Message& message);

} // namespace finq::service
