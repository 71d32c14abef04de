#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "finq/v1/task_service.grpc.pb.h"
#include "internal/service/task_wire.hpp"

using namespace finq::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  finqctl <addr> submit <operation> [json_arguments] [label]\n"
            << "  finqctl <addr> status <task_id>\n"
            << "  finqctl <addr> list [pending|running|completed|failed]\n"
            << "  finqctl <addr> clean [max_age_seconds]\n"
            << "  finqctl <addr> stats\n"
            << "  finqctl <addr> ops\n";
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  try {
    std::cout << finq::service::ToJson(resp) << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TaskQueueService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 4) return 1;

    SubmitTaskRequest req;
    req.set_operation(argv[3]);

    if (argc >= 5) {
      auto parsed = google::protobuf::util::JsonStringToMessage(argv[4], req.mutable_arguments());
      if (!parsed.ok()) {
        std::cerr << "invalid arguments: " << parsed.ToString() << "\n";
        return 1;
      }
    }
    if (argc >= 6) {
      req.set_label(argv[5]);
    }

    SubmitTaskResponse resp;
    return Report(stub->SubmitTask(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetTaskRequest req;
    req.set_task_id(argv[3]);

    GetTaskResponse resp;
    return Report(stub->GetTask(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListTasksRequest req;
    if (argc >= 4) {
      auto parsed = finq::model::ParseStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status_filter(finq::service::ToProto(parsed.value()));
    }

    ListTasksResponse resp;
    return Report(stub->ListTasks(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "clean") {
    CleanTasksRequest req;
    if (argc >= 4) {
      std::int64_t seconds = 0;
      try {
        seconds = std::stoll(argv[3]);
      } catch (const std::exception&) {
        std::cerr << "invalid max_age: " << argv[3] << "\n";
        return 1;
      }
      req.mutable_max_age()->set_seconds(seconds);
    }

    CleanTasksResponse resp;
    return Report(stub->CleanTasks(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    QueueStatsRequest  req;
    QueueStatsResponse resp;
    return Report(stub->QueueStats(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "ops") {
    ListOperationsRequest  req;
    ListOperationsResponse resp;
    return Report(stub->ListOperations(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
