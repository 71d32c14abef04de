#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace finq::runtime::config {
class RuntimeConfig;
}

namespace finq::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const finq::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace finq::observability

#define FINQ_LOG_INFO(message, ...) ::finq::observability::LogInfo((message), ##__VA_ARGS__)
#define FINQ_LOG_WARN(message, ...) ::finq::observability::LogWarn((message), ##__VA_ARGS__)
#define FINQ_LOG_ERROR(message, ...) ::finq::observability::LogError((message), ##__VA_ARGS__)
