#include "task_server.hpp"

#include "grpc_error.hpp"

namespace finq::grpc {

using namespace finq::v1;

TaskServer::TaskServer(std::shared_ptr<finq::service::TaskService> svc) : service_(std::move(svc)) {
}

::grpc::Status TaskServer::SubmitTask(::grpc::ServerContext*, const SubmitTaskRequest* req, SubmitTaskResponse* resp) {
  try {
    *resp = service_->SubmitTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::GetTask(::grpc::ServerContext*, const GetTaskRequest* req, GetTaskResponse* resp) {
  try {
    *resp = service_->GetTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::ListTasks(::grpc::ServerContext*, const ListTasksRequest* req, ListTasksResponse* resp) {
  try {
    *resp = service_->ListTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::CleanTasks(::grpc::ServerContext*, const CleanTasksRequest* req, CleanTasksResponse* resp) {
  try {
    *resp = service_->CleanTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::QueueStats(::grpc::ServerContext*, const QueueStatsRequest* req, QueueStatsResponse* resp) {
  try {
    *resp = service_->QueueStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::ListOperations(::grpc::ServerContext*, const ListOperationsRequest* req, ListOperationsResponse* resp) {
  try {
    *resp = service_->ListOperations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace finq::grpc
