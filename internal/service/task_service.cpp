#include "task_service.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "operation_registry.hpp"
#include "task_wire.hpp"

namespace finq::service {

using namespace finq::v1;

namespace {

constexpr const char* kStatusUrlPrefix = "/api/v1/tasks/";

// Runs one request with a span, request metrics and failure logging.
template <typename Fn>
auto Traced(std::string_view route, Fn&& fn) -> decltype(fn(std::declval<observability::SpanScope&>())) {
  observability::SpanScope span(route);
  const auto               started_at = std::chrono::steady_clock::now();
  auto&                    metrics    = observability::Metrics::Instance();

  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto resp = fn(span);
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FINQ_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

void RequireTaskId(const std::string& task_id) {
  if (task_id.empty()) {
    throw util::InvalidArgument("task_id is required");
  }
}

} // namespace

TaskService::TaskService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitTaskResponse TaskService::SubmitTask(const SubmitTaskRequest& req) {
  return Traced("TaskService.SubmitTask", [&](observability::SpanScope& span) {
    if (req.operation().empty()) {
      throw util::InvalidArgument("operation is required");
    }
    span.SetAttribute("operation", req.operation());

    auto operation = ctx_.operations->Build(req.operation(), req.arguments());
    auto label     = req.label().empty() ? req.operation() : req.label();
    auto task_id   = ctx_.queue->Submit(std::move(operation), std::move(label));

    span.SetAttribute("task_id", task_id);

    SubmitTaskResponse resp;
    resp.set_task_id(task_id);
    resp.set_status(model::StatusName(model::TaskStatus::kPending));
    resp.set_status_url(kStatusUrlPrefix + task_id);
    return resp;
  });
}

GetTaskResponse TaskService::GetTask(const GetTaskRequest& req) {
  return Traced("TaskService.GetTask", [&](observability::SpanScope& span) {
    RequireTaskId(req.task_id());
    span.SetAttribute("task_id", req.task_id());

    GetTaskResponse resp;
    *resp.mutable_task() = ToProto(ctx_.queue->GetStatus(req.task_id()));
    return resp;
  });
}

ListTasksResponse TaskService::ListTasks(const ListTasksRequest& req) {
  return Traced("TaskService.ListTasks", [&](observability::SpanScope&) {
    ListTasksResponse resp;
    for (const auto& record : ctx_.queue->List(FromProto(req.status_filter()))) {
      *resp.add_tasks() = ToProto(record);
    }
    return resp;
  });
}

CleanTasksResponse TaskService::CleanTasks(const CleanTasksRequest& req) {
  return Traced("TaskService.CleanTasks", [&](observability::SpanScope& span) {
    auto max_age = ctx_.queue->DefaultMaxAge();
    if (req.has_max_age()) {
      if (req.max_age().seconds() < 0 || req.max_age().nanos() < 0) {
        throw util::InvalidArgument("max_age must not be negative");
      }
      max_age = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(req.max_age()));
    }
    span.SetAttribute("max_age_s", static_cast<std::int64_t>(max_age.count()));

    CleanTasksResponse resp;
    resp.set_removed(ctx_.queue->Clean(max_age));
    return resp;
  });
}

QueueStatsResponse TaskService::QueueStats(const QueueStatsRequest&) {
  return Traced("TaskService.QueueStats", [&](observability::SpanScope&) { return ToProto(ctx_.queue->Stats()); });
}

ListOperationsResponse TaskService::ListOperations(const ListOperationsRequest&) {
  return Traced("TaskService.ListOperations", [&](observability::SpanScope&) {
    ListOperationsResponse resp;
    for (auto& name : ctx_.operations->Names()) {
      resp.add_operations(std::move(name));
    }
    return resp;
  });
}

} // namespace finq::service
