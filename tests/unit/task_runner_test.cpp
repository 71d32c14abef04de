#include "internal/queue/task_runner.hpp"

#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using finq::model::TaskError;
using finq::model::TaskRecord;
using finq::model::TaskStatus;
using finq::queue::OperationResult;
using finq::queue::TaskRunner;
using finq::queue::TaskStore;

struct Fixture {
  std::shared_ptr<TaskStore> store = std::make_shared<TaskStore>();
  TaskRunner                 runner{store, finq::util::Now};

  std::string Add(const std::string& id, const std::string& name = "op") {
    store->Insert(TaskRecord(id, name, finq::util::Now()));
    return id;
  }

  TaskRecord Get(const std::string& id) const {
    auto record = store->Get(id);
    assert(record.has_value());
    return *record;
  }
};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestSuccessfulOperationCompletes() {
  Fixture f;
  f.Add("t1", "add");
  f.runner.Execute("t1", [] { return OperationResult::Ok(finq::queue::NumberValue(42)); });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kCompleted);
  assert(record.result.has_value());
  assert(record.result->number_value() == 42);
  assert(!record.error.has_value());
  assert(record.started_at.has_value());
  assert(record.completed_at.has_value());
  assert(record.created_at <= *record.started_at);
  assert(*record.started_at <= *record.completed_at);
}

void TestEmptyOkResultIsNull() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", [] { return OperationResult{}; });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kCompleted);
  assert(record.result.has_value());
  assert(record.result->kind_case() == google::protobuf::Value::kNullValue);
}

void TestErrOutcomeFails() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", [] { return OperationResult::Err("InvalidArgument", "need a number"); });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kFailed);
  assert(!record.result.has_value());
  assert(record.error.has_value());
  assert(record.error->error_type == "InvalidArgument");
  assert(record.error->error_message == "need a number");
  assert(record.error->traceback == "Traceback (outermost first):\n  raised InvalidArgument: need a number\n");
}

void TestErrOutcomeKeepsItsOwnTraceback() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", [] { return OperationResult::Err("E", "m", "custom trace\n"); });
  assert(f.Get("t1").error->traceback == "custom trace\n");
}

void TestThrownExceptionIsCaptured() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", []() -> OperationResult { throw std::invalid_argument("bad input"); });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kFailed);
  assert(!record.result.has_value());
  assert(record.error->error_type == "std::invalid_argument");
  assert(Contains(record.error->error_message, "bad input"));
  assert(Contains(record.error->traceback, "raised std::invalid_argument: bad input"));
  assert(record.completed_at.has_value());
}

void TestNestedCausesAppearInTraceback() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", []() -> OperationResult {
    try {
      throw std::runtime_error("disk full");
    } catch (const std::exception&) {
      std::throw_with_nested(std::logic_error("lookup failed"));
    }
  });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kFailed);
  assert(record.error->error_type == "std::logic_error");
  assert(record.error->error_message == "lookup failed");

  const auto& tb = record.error->traceback;
  assert(Contains(tb, "raised std::logic_error: lookup failed"));
  assert(Contains(tb, "caused by std::runtime_error: disk full"));
  assert(tb.find("lookup failed") < tb.find("disk full"));
}

void TestNonStandardThrowIsCaptured() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", []() -> OperationResult { throw 7; });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kFailed);
  assert(record.error->error_type == "unknown");
}

void TestSecondExecuteIsIgnored() {
  Fixture f;
  f.Add("t1");
  f.runner.Execute("t1", [] { return OperationResult::Ok(finq::queue::StringValue("first")); });
  f.runner.Execute("t1", [] { return OperationResult::Ok(finq::queue::StringValue("second")); });

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kCompleted);
  assert(record.result->string_value() == "first");
}

void TestMissingTaskIsIgnored() {
  Fixture f;
  bool    ran = false;
  f.runner.Execute("nope", [&] {
    ran = true;
    return OperationResult{};
  });
  assert(!ran);
  assert(f.store->Size() == 0);
}

void TestFailToStartStampsBothTimes() {
  Fixture f;
  f.Add("t1");
  f.runner.FailToStart("t1", TaskError{"ExecutorUnavailable", "worker pool is shut down", ""});

  const auto record = f.Get("t1");
  assert(record.status == TaskStatus::kFailed);
  assert(record.error->error_type == "ExecutorUnavailable");
  assert(record.error->traceback == "Traceback (outermost first):\n  raised ExecutorUnavailable: worker pool is shut down\n");
  assert(record.started_at.has_value());
  assert(record.started_at == record.completed_at);
}

void TestClockBehindCreationIsClamped() {
  auto       store   = std::make_shared<TaskStore>();
  const auto created = finq::util::Now();
  TaskRunner runner(store, [created] { return created - std::chrono::hours(1); });

  store->Insert(TaskRecord("t1", "op", created));
  runner.Execute("t1", [] { return OperationResult{}; });

  const auto record = *store->Get("t1");
  assert(*record.started_at == created);
  assert(*record.completed_at == created);
}

} // namespace

int main() {
  TestSuccessfulOperationCompletes();
  TestEmptyOkResultIsNull();
  TestErrOutcomeFails();
  TestErrOutcomeKeepsItsOwnTraceback();
  TestThrownExceptionIsCaptured();
  TestNestedCausesAppearInTraceback();
  TestNonStandardThrowIsCaptured();
  TestSecondExecuteIsIgnored();
  TestMissingTaskIsIgnored();
  TestFailToStartStampsBothTimes();
  TestClockBehindCreationIsClamped();

  std::cout << "finq_unit_task_runner: pass\n";
  return 0;
}
