#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"

namespace {

using telemetry::config::ConfigLoader;
using telemetry::config::ResolveOptions;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "telemetry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
  max_receive_message_bytes: 65536
database:
  sqlite:
    path: "C:\\telemetry\\\"quoted\"\\gate.db"
logging:
  level: debug
rate_limits:
  ingest:
    capacity: 10
    window: "30s"
  rotation:
    capacity: 2
    window: "7200s"
  sweep_interval: "15s"
quota:
  free_limit_bytes: 1000000
  recompute_interval: "600s"
credentials:
  expiry_days: 30
alerts:
  default_high_threshold_c: 28.5
  default_low_threshold_c: 12
  default_cooldown_minutes: 15
notifier:
  worker_threads: 4
  queue_capacity: 64
  smtp:
    url: "smtp://mail.example.com:587"
    sender: "alerts@example.com"
    timeout_ms: 2500
validation:
  setpoint_min_c: 7
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "C:\\telemetry\\\"quoted\"\\gate.db");
  assert(config.logging().level() == "debug");

  const auto options = ResolveOptions(config);
  assert(options.bind_address == "127.0.0.1:6000");
  assert(options.max_receive_message_bytes == 65536);
  assert(options.ingest_limit.capacity == 10);
  assert(options.ingest_limit.window == std::chrono::seconds(30));
  assert(options.rotation_limit.capacity == 2);
  assert(options.rotation_limit.window == std::chrono::hours(2));
  assert(options.sweep_interval == std::chrono::seconds(15));
  assert(options.ceilings.free_bytes == 1000000);
  assert(options.ceilings.standard_bytes == 10ull * telemetry::quota::kGiB);
  assert(options.recompute_interval == std::chrono::minutes(10));
  assert(options.credentials.expiry == std::chrono::hours(24 * 30));
  assert(options.alert_defaults.high_threshold_c == 28.5);
  assert(options.alert_defaults.low_threshold_c == 12.0);
  assert(options.alert_defaults.cooldown_minutes == 15);
  assert(options.notifier.worker_threads == 4);
  assert(options.notifier.queue_capacity == 64);
  assert(options.smtp);
  assert(options.smtp->url == "smtp://mail.example.com:587");
  assert(options.smtp->timeout == std::chrono::milliseconds(2500));
  assert(options.validation.setpoint_min_c == 7.0);
  assert(options.validation.setpoint_max_c == 35.0);
}

void TestEmptyConfigUsesDefaults() {
  const auto options = ResolveOptions(ConfigLoader::LoadFromYamlString(""));
  assert(options.bind_address == "0.0.0.0:50051");
  assert(options.ingest_limit.capacity == 60);
  assert(options.ingest_limit.window == std::chrono::seconds(60));
  assert(options.rotation_limit.capacity == 5);
  assert(options.rotation_limit.window == std::chrono::hours(1));
  assert(options.ceilings.free_bytes == 2ull * telemetry::quota::kGiB);
  assert(options.ceilings.premium_bytes == 1024ull * telemetry::quota::kGiB);
  assert(options.credentials.expiry == std::chrono::hours(24 * 365));
  assert(options.alert_defaults.high_threshold_c == 30.0);
  assert(options.alert_defaults.low_threshold_c == 10.0);
  assert(options.alert_defaults.cooldown_minutes == 30);
  assert(!options.smtp);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestExpiryCanBeDisabled() {
  const auto options = ResolveOptions(ConfigLoader::LoadFromYamlString(R"(credentials:
  expiry_days: 10
  disable_expiry: true
)"));
  assert(options.credentials.expiry.count() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  assert(ThrowsRuntimeError([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }) && "ConfigLoader must reject unknown fields.");
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/telemetry.yaml"); }));
}

void TestInconsistentValuesAreRejected() {
  assert(ThrowsRuntimeError([] {
    (void)ResolveOptions(ConfigLoader::LoadFromYamlString(R"(alerts:
  default_high_threshold_c: 10
  default_low_threshold_c: 20
)"));
  }));

  assert(ThrowsRuntimeError([] {
    (void)ResolveOptions(ConfigLoader::LoadFromYamlString(R"(validation:
  setpoint_min_c: 30
  setpoint_max_c: 20
)"));
  }));

  assert(ThrowsRuntimeError([] {
    (void)ResolveOptions(ConfigLoader::LoadFromYamlString(R"(rate_limits:
  ingest:
    window: "-5s"
)"));
  }));

  assert(ThrowsRuntimeError([] {
    (void)ResolveOptions(ConfigLoader::LoadFromYamlString(R"(notifier:
  smtp:
    url: "smtp://mail.example.com"
)"));
  }));
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyConfigUsesDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestExpiryCanBeDisabled();
  TestUnknownFieldsAreRejected();
  TestInconsistentValuesAreRejected();

  std::cout << "telemetry_unit_config_loader: pass\n";
  return 0;
}
