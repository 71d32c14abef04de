#pragma once

#include "finq/v1/task.pb.h"
#include "service_context.hpp"

namespace finq::service {

/*
  Request/response layer over the task queue.

  Errors are thrown as util:: exceptions and mapped by the transport.
*/
class TaskService {
public:
  explicit TaskService(ServiceContext ctx);

  finq::v1::SubmitTaskResponse SubmitTask(const finq::v1::SubmitTaskRequest& req);

  finq::v1::GetTaskResponse GetTask(const finq::v1::GetTaskRequest& req);

  finq::v1::ListTasksResponse ListTasks(const finq::v1::ListTasksRequest& req);

  finq::v1::CleanTasksResponse CleanTasks(const finq::v1::CleanTasksRequest& req);

  finq::v1::QueueStatsResponse QueueStats(const finq::v1::QueueStatsRequest& req);

  finq::v1::ListOperationsResponse ListOperations(const finq::v1::ListOperationsRequest& req);

private:
  ServiceContext ctx_;
};

}
