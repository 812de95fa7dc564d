#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace {

using telemetry::observability::BoolField;
using telemetry::observability::DoubleField;
using telemetry::observability::FormatFields;
using telemetry::observability::IntField;
using telemetry::observability::StringField;

void TestPlainFieldsAreKeyValue() {
  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("serial", "TH-001"), IntField("samples", 42), BoolField("storage_full", false)}) ==
         "serial=TH-001 samples=42 storage_full=false");
  assert(FormatFields({DoubleField("temp_inside_c", 30.456)}) == "temp_inside_c=30.46");
}

void TestClientTextCannotForgeFieldsOrLines() {
  assert(FormatFields({StringField("name", "Server room")}) == "name=\"Server room\"");
  assert(FormatFields({StringField("name", "")}) == "name=\"\"");
  assert(FormatFields({StringField("name", "x owner=root")}) == "name=\"x owner=root\"");
  assert(FormatFields({StringField("error", "bad\r\nlevel=info \"quoted\"")}) == "error=\"bad\\r\\nlevel=info \\\"quoted\\\"\"");
  assert(FormatFields({StringField("raw", std::string("a\x01" "b", 3))}) == "raw=\"a\\x01b\"");
}

void TestEnvironmentOverridesConfiguredLevel() {
  telemetry::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");

  ::unsetenv("TELEMETRY_LOG_LEVEL");
  telemetry::observability::InitializeLogging(config);
  auto logger = spdlog::get(telemetry::observability::kLoggerName);
  assert(logger);
  assert(logger->level() == spdlog::level::warn);

  // initializing again reuses the named logger
  ::setenv("TELEMETRY_LOG_LEVEL", "debug", 1);
  telemetry::observability::InitializeLogging(config);
  assert(spdlog::get(telemetry::observability::kLoggerName) == logger);
  assert(logger->level() == spdlog::level::debug);
  ::unsetenv("TELEMETRY_LOG_LEVEL");

  TELEMETRY_LOG_INFO("logging initialized", {StringField("serial", "TH-001")});
  TELEMETRY_LOG_WARN("no fields");
}

void TestOtlpEndpointDefaultsToLocalCollector() {
  telemetry::runtime::config::RuntimeConfig config;
  assert(telemetry::observability::OtlpEndpoint(config) == "localhost:4317");

  config.mutable_observability()->set_otlp_endpoint("collector:4317");
  assert(telemetry::observability::OtlpEndpoint(config) == "collector:4317");

  // spans are inert until tracing is initialized
  telemetry::observability::SpanScope span("IngestPipeline.Run");
  span.SetAttribute("serial", "TH-001");
  span.RecordException("rejected");
}

} // namespace

int main() {
  TestPlainFieldsAreKeyValue();
  TestClientTextCannotForgeFieldsOrLines();
  TestEnvironmentOverridesConfiguredLevel();
  TestOtlpEndpointDefaultsToLocalCollector();

  telemetry::observability::ShutdownLogging();
  std::cout << "telemetry_unit_logging: pass\n";
  return 0;
}
