#pragma once

#include <memory>

namespace finq::queue { class TaskQueue; }

namespace finq::service {

class OperationRegistry;

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<finq::queue::TaskQueue> queue;
  std::shared_ptr<OperationRegistry>      operations;
};

}
