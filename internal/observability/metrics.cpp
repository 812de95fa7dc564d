#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TELEMETRY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TELEMETRY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace telemetry::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::chrono::milliseconds kDefaultExportInterval{10000};

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const telemetry::runtime::config::RuntimeConfig& config) {
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = OtlpEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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

void Count(const opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>& counter, const char* key, std::string_view value) {
  if (!counter) return;
  const std::initializer_list<AttributePair> attributes = {{key, std::string(value)}};
  AddWithAttributes(counter, static_cast<std::uint64_t>(1), attributes);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ingest_rejections;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> alerts_fired;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> notification_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      notification_duration_ms;
};

bool InitializeMetrics(const telemetry::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      observability.metrics_interval_ms() > 0 ? std::chrono::milliseconds(observability.metrics_interval_ms()) : kDefaultExportInterval;
  // the export has to finish before the next one is due
  reader_options.export_timeout_millis = reader_options.export_interval_millis / 2;

#ifdef TELEMETRY_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(config), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", std::string(kInstrumentationName)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
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
  impl_->meter  = provider->GetMeter(kInstrumentationName);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("telemetry.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("telemetry.request.latency_ms", "ms", "End-to-end request latency");
  impl_->ingest_rejections  = impl_->meter->CreateUInt64Counter("telemetry.ingest.rejections", "1", "Ingest requests rejected by a gate");
  impl_->alerts_fired       = impl_->meter->CreateUInt64Counter("telemetry.alert.fired", "1", "Threshold alerts fired");
  impl_->notification_failures =
      impl_->meter->CreateUInt64Counter("telemetry.notification.failures", "1", "Alert notifications that could not be delivered");
  impl_->notification_duration_ms =
      impl_->meter->CreateDoubleHistogram("telemetry.notification.duration_ms", "ms", "Alert notification dispatch duration");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordIngestRejection(std::string_view error_class) {
  if (impl_) Count(impl_->ingest_rejections, "class", error_class);
}

void Metrics::RecordAlertFired(std::string_view direction) {
  if (impl_) Count(impl_->alerts_fired, "direction", direction);
}

void Metrics::RecordNotificationFailure(std::string_view reason) {
  if (impl_) Count(impl_->notification_failures, "reason", reason);
}

void Metrics::ObserveNotificationDurationMs(std::string_view sink, double duration_ms) {
  if (!impl_ || !impl_->notification_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"sink", std::string(sink)}};
  RecordWithAttributes(impl_->notification_duration_ms, duration_ms, attributes);
}

} // namespace telemetry::observability

#endif
