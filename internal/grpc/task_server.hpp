#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "finq/v1/task_service.grpc.pb.h"
#include "internal/service/task_service.hpp"

namespace finq::grpc {

class TaskServer final : public finq::v1::TaskQueueService::Service {
public:
  explicit TaskServer(std::shared_ptr<finq::service::TaskService> svc);

  ::grpc::Status SubmitTask(::grpc::ServerContext*, const finq::v1::SubmitTaskRequest*, finq::v1::SubmitTaskResponse*) override;

  ::grpc::Status GetTask(::grpc::ServerContext*, const finq::v1::GetTaskRequest*, finq::v1::GetTaskResponse*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*, const finq::v1::ListTasksRequest*, finq::v1::ListTasksResponse*) override;

  ::grpc::Status CleanTasks(::grpc::ServerContext*, const finq::v1::CleanTasksRequest*, finq::v1::CleanTasksResponse*) override;

  ::grpc::Status QueueStats(::grpc::ServerContext*, const finq::v1::QueueStatsRequest*, finq::v1::QueueStatsResponse*) override;

  ::grpc::Status ListOperations(::grpc::ServerContext*, const finq::v1::ListOperationsRequest*, finq::v1::ListOperationsResponse*) override;

private:
  std::shared_ptr<finq::service::TaskService> service_;
};

}
