#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace telemetry::runtime::config {
class RuntimeConfig;
}

namespace telemetry::observability {

// Both signals go to one OTLP gRPC collector, observability.otlp_endpoint
// or this default.
inline constexpr const char* kDefaultOtlpEndpoint = "localhost:4317";
inline constexpr const char* kInstrumentationName = "telemetry-gate";

std::string OtlpEndpoint(const telemetry::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const telemetry::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const telemetry::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per RPC, ingest run and alert evaluation; a no-op until
// InitializeTracing has installed a provider.
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

/*
  Process-wide instruments.

    telemetry.request.count             route, success
    telemetry.request.latency_ms        route
    telemetry.ingest.rejections         class
    telemetry.alert.fired               direction
    telemetry.notification.failures     reason
    telemetry.notification.duration_ms  sink
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordIngestRejection(std::string_view error_class);
  void RecordAlertFired(std::string_view direction);
  void RecordNotificationFailure(std::string_view reason);
  void ObserveNotificationDurationMs(std::string_view sink, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const telemetry::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const telemetry::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordIngestRejection(std::string_view) {
}

inline void Metrics::RecordAlertFired(std::string_view) {
}

inline void Metrics::RecordNotificationFailure(std::string_view) {
}

inline void Metrics::ObserveNotificationDurationMs(std::string_view, double) {
}
#endif

} // namespace telemetry::observability
