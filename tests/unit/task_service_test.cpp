#include "internal/service/task_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <thread>

#include "internal/executor/thread_per_task_executor.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/service/operation_registry.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/task_wire.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using finq::service::OperationRegistry;
using finq::service::ServiceContext;
using finq::service::TaskService;

using namespace std::chrono_literals;

ServiceContext BuildServiceContext() {
  ServiceContext ctx;
  ctx.queue      = std::make_shared<finq::queue::TaskQueue>(std::make_shared<finq::executor::ThreadPerTaskExecutor>());
  ctx.operations = std::make_shared<OperationRegistry>();
  finq::service::RegisterBuiltinOperations(*ctx.operations);
  return ctx;
}

finq::v1::TaskRecord WaitForTerminal(TaskService& service, const std::string& task_id) {
  finq::v1::GetTaskRequest req;
  req.set_task_id(task_id);

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (true) {
    auto task = service.GetTask(req).task();
    if (task.status() == "completed" || task.status() == "failed") return task;
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(2ms);
  }
}

finq::v1::SubmitTaskRequest MakeSubmit(const std::string& operation) {
  finq::v1::SubmitTaskRequest req;
  req.set_operation(operation);
  return req;
}

void TestRegistryRejectsDuplicatesAndUnknownNames() {
  OperationRegistry registry;
  finq::service::RegisterBuiltinOperations(registry);
  assert(registry.Contains("echo"));
  assert(registry.Contains("sleep"));

  bool threw = false;
  try {
    registry.Register("echo", [](const google::protobuf::Struct&) { return finq::queue::Operation{}; });
  } catch (const finq::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)registry.Build("missing", {});
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register("", [](const google::protobuf::Struct&) { return finq::queue::Operation{}; });
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSubmitEchoRoundTrip() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  auto req = MakeSubmit("echo");
  (*req.mutable_arguments()->mutable_fields())["question"].set_string_value("why?");

  const auto resp = service.SubmitTask(req);
  assert(!resp.task_id().empty());
  assert(resp.status() == "pending");
  assert(resp.status_url() == "/api/v1/tasks/" + resp.task_id());

  const auto task = WaitForTerminal(service, resp.task_id());
  assert(task.status() == "completed");
  assert(task.function_name() == "echo");
  assert(task.result().struct_value().fields().at("question").string_value() == "why?");
  assert(!task.has_error());
  assert(task.started_at().kind_case() == google::protobuf::Value::kStringValue);
  assert(task.completed_at().kind_case() == google::protobuf::Value::kStringValue);
  assert(task.started_at().string_value() <= task.completed_at().string_value());
}

void TestLabelOverridesFunctionName() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  auto req = MakeSubmit("echo");
  req.set_label("ask");
  const auto task = WaitForTerminal(service, service.SubmitTask(req).task_id());
  assert(task.function_name() == "ask");
}

void TestSleepValidatesArguments() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  const auto bad  = WaitForTerminal(service, service.SubmitTask(MakeSubmit("sleep")).task_id());
  assert(bad.status() == "failed");
  assert(bad.error().error_type() == "InvalidArgument");
  assert(bad.error().traceback().rfind("Traceback (outermost first):\n  raised InvalidArgument: ", 0) == 0);
  assert(bad.result().kind_case() == google::protobuf::Value::kNullValue);

  auto req = MakeSubmit("sleep");
  (*req.mutable_arguments()->mutable_fields())["seconds"].set_number_value(0.01);
  const auto ok = WaitForTerminal(service, service.SubmitTask(req).task_id());
  assert(ok.status() == "completed");
  assert(ok.result().struct_value().fields().at("slept_seconds").number_value() == 0.01);
}

void TestUnknownOperationIsInvalidArgument() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  bool threw = false;
  try {
    (void)service.SubmitTask(MakeSubmit("does-not-exist"));
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(ctx.queue->Stats().total == 0);
}

void TestGetTaskErrors() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  finq::v1::GetTaskRequest req;
  bool                     threw = false;
  try {
    (void)service.GetTask(req);
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  req.set_task_id("missing");
  threw = false;
  try {
    (void)service.GetTask(req);
  } catch (const finq::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListCleanAndStats() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  const auto first  = service.SubmitTask(MakeSubmit("echo")).task_id();
  const auto second = service.SubmitTask(MakeSubmit("sleep")).task_id();
  WaitForTerminal(service, first);
  WaitForTerminal(service, second);

  finq::v1::ListTasksRequest all;
  assert(service.ListTasks(all).tasks_size() == 2);

  finq::v1::ListTasksRequest failed_only;
  failed_only.set_status_filter(finq::v1::TASK_STATUS_FAILED);
  const auto failed = service.ListTasks(failed_only);
  assert(failed.tasks_size() == 1);
  assert(failed.tasks(0).task_id() == second);

  const auto stats = service.QueueStats({});
  assert(stats.total() == 2);
  assert(stats.completed() == 1);
  assert(stats.failed() == 1);

  // Without max_age the queue default (one hour) applies.
  assert(service.CleanTasks({}).removed() == 0);

  std::this_thread::sleep_for(5ms);
  finq::v1::CleanTasksRequest clean_now;
  clean_now.mutable_max_age()->set_seconds(0);
  assert(service.CleanTasks(clean_now).removed() == 2);

  finq::v1::CleanTasksRequest negative;
  negative.mutable_max_age()->set_seconds(-1);
  bool threw = false;
  try {
    (void)service.CleanTasks(negative);
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestListOperationsIsSorted() {
  auto        ctx = BuildServiceContext();
  TaskService service(ctx);

  const auto ops = service.ListOperations({});
  assert(ops.operations_size() == 2);
  assert(ops.operations(0) == "echo");
  assert(ops.operations(1) == "sleep");
}

void TestWireRecordForPendingTask() {
  finq::model::TaskRecord record("abc", "add", finq::util::Clock::from_time_t(0) + 123456us);

  const auto wire = finq::service::ToProto(record);
  assert(wire.status() == "pending");
  assert(wire.created_at() == "1970-01-01T00:00:00.123456Z");
  assert(wire.started_at().kind_case() == google::protobuf::Value::kNullValue);
  assert(wire.completed_at().kind_case() == google::protobuf::Value::kNullValue);
  assert(wire.result().kind_case() == google::protobuf::Value::kNullValue);
  assert(!wire.has_error());

  const auto json = finq::service::ToJson(wire);
  assert(json.find("\"task_id\":\"abc\"") != std::string::npos);
  assert(json.find("\"result\":null") != std::string::npos);
  assert(json.find("\"started_at\":null") != std::string::npos);
  assert(json.find("\"completed_at\":null") != std::string::npos);
  assert(json.find("\"created_at\":\"1970-01-01T00:00:00.123456Z\"") != std::string::npos);
}

void TestIsoTimestampFormat() {
  const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)");
  assert(std::regex_match(finq::util::ToIso8601(finq::util::Now()), iso));
  assert(finq::util::ToIso8601(finq::util::Clock::from_time_t(86400)) == "1970-01-02T00:00:00.000000Z");
}

void TestStatusFilterMapping() {
  assert(!finq::service::FromProto(finq::v1::TASK_STATUS_UNSPECIFIED).has_value());
  assert(finq::service::FromProto(finq::v1::TASK_STATUS_RUNNING) == finq::model::TaskStatus::kRunning);

  // Command-line status names reach the wire filter through the model's parser.
  for (const auto* name : {"pending", "running", "completed", "failed"}) {
    const auto parsed = finq::model::ParseStatus(name);
    assert(parsed.has_value());
    const auto wire = finq::service::ToProto(*parsed);
    assert(wire != finq::v1::TASK_STATUS_UNSPECIFIED);
    assert(finq::service::FromProto(wire) == parsed);
  }
  assert(finq::service::ToProto(finq::model::TaskStatus::kFailed) == finq::v1::TASK_STATUS_FAILED);
}

} // namespace

int main() {
  TestRegistryRejectsDuplicatesAndUnknownNames();
  TestSubmitEchoRoundTrip();
  TestLabelOverridesFunctionName();
  TestSleepValidatesArguments();
  TestUnknownOperationIsInvalidArgument();
  TestGetTaskErrors();
  TestListCleanAndStats();
  TestListOperationsIsSorted();
  TestWireRecordForPendingTask();
  TestIsoTimestampFormat();
  TestStatusFilterMapping();

  std::cout << "finq_unit_task_service: pass\n";
  return 0;
}
