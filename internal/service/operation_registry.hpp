#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "internal/queue/operation.hpp"

namespace finq::service {

/*
  Maps operation names to factories that bind request arguments into a
  queue::Operation. Remote callers cannot ship closures; they name one of
  these instead. The application registers its question handlers here.
*/
class OperationRegistry {
 public:
  using Factory = std::function<queue::Operation(const google::protobuf::Struct& arguments)>;

  // Throws util::AlreadyExists on a duplicate name.
  void Register(const std::string& name, Factory factory);

  // Throws util::InvalidArgument for unknown names.
  queue::Operation Build(const std::string& name, const google::protobuf::Struct& arguments) const;

  bool                     Contains(const std::string& name) const;
  std::vector<std::string> Names() const;

 private:
  mutable std::mutex             mutex_;
  std::map<std::string, Factory> factories_;
};

// "echo" and "sleep", used for smoke-testing a deployment.
void RegisterBuiltinOperations(OperationRegistry& registry);

} // namespace finq::service
