#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FINQ_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FINQ_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace finq::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

// Attribute values only borrow; the caller's text must outlive the Add/Record call.
opentelemetry::nostd::string_view AttributeText(std::string_view value) {
  return {value.data(), value.size()};
}
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool task_metrics_enabled{true};
  bool operation_labels_enabled{true};
};

MetricsOptions g_metrics_options;

using finq::runtime::config::ObservabilityConfig;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == finq::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string ResolveEndpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return UsesHttp(config) ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource() {
  resource::ResourceAttributes attrs = {{"service.name", std::string("finq")}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool InstallProvider(const ObservabilityConfig& config, std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (UsesHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  if (timeout.count() > 0) {
    reader_options.export_timeout_millis = timeout;
  }
#ifdef FINQ_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto res   = BuildResource();
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      task_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   tasks_in_queue_gauge;

  std::mutex                                    tasks_in_queue_mutex;
  std::unordered_map<std::string, std::int64_t> tasks_in_queue_values;
};

bool InitializeMetrics(const finq::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  const auto  interval_ms   = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;

  g_metrics_options.request_metrics_enabled  = metric_config.request_metrics_enabled();
  g_metrics_options.task_metrics_enabled     = metric_config.task_metrics_enabled();
  g_metrics_options.operation_labels_enabled = metric_config.operation_labels_enabled();

  return InstallProvider(observability, std::chrono::milliseconds(interval_ms), std::chrono::milliseconds(metric_config.export_timeout_ms()));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("finq", "0.1.0");

  impl_->request_count        = impl_->meter->CreateUInt64Counter("finq.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms   = impl_->meter->CreateDoubleHistogram("finq.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->task_count           = impl_->meter->CreateUInt64Counter("finq.task.count", "1", "Background tasks by operation and status");
  impl_->task_duration_ms     = impl_->meter->CreateDoubleHistogram("finq.task.duration_ms", "ms", "Background task execution time in milliseconds");
  impl_->tasks_in_queue_gauge = impl_->meter->CreateInt64ObservableGauge("finq.tasks.in_queue", "Tasks held by the queue, by status", "1");
  impl_->tasks_in_queue_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->tasks_in_queue_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [status, count] : impl->tasks_in_queue_values) {
          const std::initializer_list<AttributePair> attributes = {{"status", status}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", AttributeText(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", AttributeText(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordTask(std::string_view operation, std::string_view status) {
  if (!impl_ || !impl_->task_count || !g_metrics_options.task_metrics_enabled) {
    return;
  }

  if (g_metrics_options.operation_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"operation", AttributeText(operation)}, {"status", AttributeText(status)}};
    AddWithAttributes(impl_->task_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", AttributeText(status)}};
  AddWithAttributes(impl_->task_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveTaskDurationMs(std::string_view operation, double duration_ms) {
  if (!impl_ || !impl_->task_duration_ms || !g_metrics_options.task_metrics_enabled) {
    return;
  }

  if (g_metrics_options.operation_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"operation", AttributeText(operation)}};
    RecordWithAttributes(impl_->task_duration_ms, duration_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->task_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetTasksInQueue(std::string_view status, std::uint64_t count) {
  if (!impl_ || !impl_->tasks_in_queue_gauge || !g_metrics_options.task_metrics_enabled) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->tasks_in_queue_mutex);
  impl_->tasks_in_queue_values[std::string(status)] = static_cast<std::int64_t>(count);
}

} // namespace finq::observability

#endif
