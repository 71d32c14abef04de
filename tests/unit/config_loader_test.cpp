#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using finq::config::ConfigLoader;
using finq::runtime::config::EXECUTOR_KIND_THREAD_PER_TASK;
using finq::runtime::config::EXECUTOR_KIND_WORKER_POOL;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "finq_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
logging:
  level: debug
  include_trace_context: true
queue:
  executor:
    kind: EXECUTOR_KIND_THREAD_PER_TASK
    workers: 8
  default_max_age: 120s
  sweep_interval: "2.5s"
observability:
  tracing_enabled: false
  otlp_endpoint: "localhost:4317"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.queue().executor().kind() == EXECUTOR_KIND_THREAD_PER_TASK);
  assert(config.queue().executor().workers() == 8);
  assert(config.queue().default_max_age().seconds() == 120);
  assert(config.queue().sweep_interval().seconds() == 2);
  assert(config.queue().sweep_interval().nanos() == 500000000);
  assert(config.observability().otlp_endpoint() == "localhost:4317");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.queue().executor().kind() == EXECUTOR_KIND_WORKER_POOL);
  assert(config.queue().executor().workers() == 0);
  assert(config.queue().default_max_age().seconds() == 3600);
  assert(!config.queue().has_sweep_interval());
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumberStaysString() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: "5"
)");
  assert(config.logging().level() == "5");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestTooManyWorkersIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(queue:
  executor:
    workers: 5000
)");
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNegativeMaxAgeIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(queue:
  default_max_age: "-5s"
)");
  } catch (const finq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/finq/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestTooManyWorkersIsRejected();
  TestNegativeMaxAgeIsRejected();
  TestMissingFileIsReported();

  std::cout << "finq_unit_config_loader: pass\n";
  return 0;
}
