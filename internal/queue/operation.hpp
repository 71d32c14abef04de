#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "google/protobuf/struct.pb.h"
#include "internal/model/task_record.hpp"

namespace finq::queue {

/*
  Outcome of one unit of work: a JSON-like value or a structured error.
*/
struct OperationResult {
  std::optional<google::protobuf::Value> value;
  std::optional<model::TaskError>        error;

  static OperationResult Ok(google::protobuf::Value v) {
    OperationResult r;
    r.value = std::move(v);
    return r;
  }

  static OperationResult Err(std::string type, std::string message, std::string traceback = {}) {
    OperationResult r;
    r.error = model::TaskError{std::move(type), std::move(message), std::move(traceback)};
    return r;
  }

  explicit operator bool() const {
    return !error.has_value();
  }
};

// Zero-argument unit of work; callers bind their arguments by capture.
using Operation = std::function<OperationResult()>;

inline google::protobuf::Value NumberValue(double number) {
  google::protobuf::Value v;
  v.set_number_value(number);
  return v;
}

inline google::protobuf::Value StringValue(std::string text) {
  google::protobuf::Value v;
  v.set_string_value(std::move(text));
  return v;
}

inline google::protobuf::Value NullValue() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

} // namespace finq::queue
