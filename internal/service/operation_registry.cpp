#include "operation_registry.hpp"

#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

#include "internal/util/errors.hpp"

namespace finq::service {

void OperationRegistry::Register(const std::string& name, Factory factory) {
  if (name.empty()) {
    throw util::InvalidArgument("operation name must not be empty");
  }

  std::lock_guard lock(mutex_);
  if (!factories_.emplace(name, std::move(factory)).second) {
    throw util::AlreadyExists("operation " + name + " already registered");
  }
}

queue::Operation OperationRegistry::Build(const std::string& name, const google::protobuf::Struct& arguments) const {
  Factory factory;
  {
    std::lock_guard lock(mutex_);
    auto            it = factories_.find(name);
    if (it == factories_.end()) {
      throw util::InvalidArgument("unknown operation: " + name);
    }
    factory = it->second;
  }
  return factory(arguments);
}

bool OperationRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return factories_.count(name) > 0;
}

std::vector<std::string> OperationRegistry::Names() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    names.push_back(name);
  }
  return names;
}

// ------------------------------------------------------------
// Built-in operations
// ------------------------------------------------------------

namespace {

constexpr double kMaxSleepSeconds = 3600.0;

queue::Operation MakeEcho(const google::protobuf::Struct& arguments) {
  return [arguments] {
    google::protobuf::Value result;
    *result.mutable_struct_value() = arguments;
    return queue::OperationResult::Ok(std::move(result));
  };
}

queue::Operation MakeSleep(const google::protobuf::Struct& arguments) {
  return [arguments] {
    auto it = arguments.fields().find("seconds");
    if (it == arguments.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
      return queue::OperationResult::Err("InvalidArgument", "sleep requires a numeric 'seconds' argument");
    }

    const double seconds = it->second.number_value();
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > kMaxSleepSeconds) {
      return queue::OperationResult::Err("InvalidArgument", "'seconds' must be between 0 and 3600");
    }

    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));

    google::protobuf::Value result;
    (*result.mutable_struct_value()->mutable_fields())["slept_seconds"] = queue::NumberValue(seconds);
    return queue::OperationResult::Ok(std::move(result));
  };
}

} // namespace

void RegisterBuiltinOperations(OperationRegistry& registry) {
  registry.Register("echo", MakeEcho);
  registry.Register("sleep", MakeSleep);
}

} // namespace finq::service
