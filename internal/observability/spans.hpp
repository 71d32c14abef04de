#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace finq::runtime::config {
class RuntimeConfig;
}

namespace finq::observability {

// Both read config.observability(); disabled sections shut the provider down.
bool InitializeTracing(const finq::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const finq::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // status is the terminal wire name ("completed" / "failed") or "submitted".
  void RecordTask(std::string_view operation, std::string_view status);
  void ObserveTaskDurationMs(std::string_view operation, double duration_ms);
  void SetTasksInQueue(std::string_view status, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const finq::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const finq::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordTask(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTaskDurationMs(std::string_view, double) {
}

inline void Metrics::SetTasksInQueue(std::string_view, std::uint64_t) {
}
#endif

} // namespace finq::observability
