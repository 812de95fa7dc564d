#include "internal/pipeline/payload_validator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using telemetry::gate::services::v1::TelemetryBody;
using telemetry::pipeline::PayloadValidator;

TelemetryBody ValidBody() {
  TelemetryBody body;
  body.set_mode("HEAT");
  body.set_setpoint_c(21.5);
  body.set_temp_inside_c(19.0);
  body.set_output("HEAT_ON");
  return body;
}

std::string Rejection(const PayloadValidator& validator, const TelemetryBody& body) {
  try {
    (void)validator.Validate(body, "TH-001", "{}");
  } catch (const telemetry::util::ValidationFailure& e) {
    return e.what();
  }
  assert(false && "body must be rejected");
  return {};
}

void TestMinimalBodyGetsDefaults() {
  PayloadValidator validator;
  const auto       sample = validator.Validate(ValidBody(), "TH-001", R"({"mode":"HEAT"})");

  assert(sample.serial == "TH-001");
  assert(sample.mode == telemetry::gate::core::v1::MODE_HEAT);
  assert(sample.output == telemetry::gate::core::v1::OUTPUT_HEAT_ON);
  assert(sample.setpoint_c == 21.5);
  assert(sample.temp_inside_c == 19.0);
  assert(!sample.temp_outside_c);
  assert(!sample.humidity_percent);
  assert(sample.hysteresis_c == 0.5);
  assert(sample.device_ts_ms == 0);
  assert(sample.raw_payload == R"({"mode":"HEAT"})");
}

void TestOptionalFieldsAreKept() {
  PayloadValidator validator;
  auto             body = ValidBody();
  body.set_temp_outside_c(-3.5);
  body.set_humidity_percent(40.0);
  body.set_hysteresis_c(1.0);
  body.set_timestamp("2024-01-15T10:30:00.250Z");

  const auto sample = validator.Validate(body, "TH-001", "{}");
  assert(sample.temp_outside_c && *sample.temp_outside_c == -3.5);
  assert(sample.humidity_percent && *sample.humidity_percent == 40.0);
  assert(sample.hysteresis_c == 1.0);
  assert(sample.device_ts_ms == 1705314600250ull);
}

void TestMissingRequiredFields() {
  PayloadValidator validator;

  auto body = ValidBody();
  body.clear_mode();
  assert(Rejection(validator, body) == "missing required field: mode");

  body = ValidBody();
  body.clear_setpoint_c();
  assert(Rejection(validator, body) == "missing required field: setpoint_c");

  body = ValidBody();
  body.clear_temp_inside_c();
  assert(Rejection(validator, body) == "missing required field: temp_inside_c");

  body = ValidBody();
  body.clear_output();
  assert(Rejection(validator, body) == "missing required field: output");
}

void TestUnknownEnumNames() {
  PayloadValidator validator;

  auto body = ValidBody();
  body.set_mode("heat");
  assert(Rejection(validator, body) == "unknown mode: heat");

  body = ValidBody();
  body.set_output("FAN_ON");
  assert(Rejection(validator, body) == "unknown output: FAN_ON");
}

void TestRangesAreInclusive() {
  PayloadValidator validator;

  auto body = ValidBody();
  body.set_setpoint_c(5.0);
  body.set_temp_inside_c(85.0);
  body.set_humidity_percent(100.0);
  body.set_hysteresis_c(0.1);
  (void)validator.Validate(body, "TH-001", "{}");

  body = ValidBody();
  body.set_setpoint_c(35.5);
  assert(Rejection(validator, body) == "setpoint_c must be between 5 and 35");

  body = ValidBody();
  body.set_temp_inside_c(-40.5);
  assert(Rejection(validator, body) == "temp_inside_c must be between -40 and 85");

  body = ValidBody();
  body.set_temp_outside_c(71.0);
  assert(Rejection(validator, body) == "temp_outside_c must be between -60 and 70");

  body = ValidBody();
  body.set_humidity_percent(-1.0);
  assert(Rejection(validator, body) == "humidity_percent must be between 0 and 100");

  body = ValidBody();
  body.set_hysteresis_c(6.0);
  assert(Rejection(validator, body) == "hysteresis_c must be between 0.1 and 5");

  body = ValidBody();
  body.set_temp_inside_c(std::numeric_limits<double>::quiet_NaN());
  assert(Rejection(validator, body) == "temp_inside_c must be between -40 and 85");
}

void TestTimestampAndAddress() {
  PayloadValidator validator;

  auto body = ValidBody();
  body.set_timestamp("yesterday");
  assert(Rejection(validator, body) == "timestamp must be RFC 3339: yesterday");

  body = ValidBody();
  body.set_device_ip(std::string(65, '1'));
  assert(Rejection(validator, body) == "device_ip too long");
}

void TestCustomRanges() {
  telemetry::pipeline::ValidationRanges ranges;
  ranges.setpoint_max_c       = 30.0;
  ranges.hysteresis_default_c = 1.5;
  PayloadValidator validator(ranges);

  auto body = ValidBody();
  assert(validator.Validate(body, "TH-001", "{}").hysteresis_c == 1.5);

  body.set_setpoint_c(31.0);
  assert(Rejection(validator, body) == "setpoint_c must be between 5 and 30");
}

} // namespace

int main() {
  TestMinimalBodyGetsDefaults();
  TestOptionalFieldsAreKept();
  TestMissingRequiredFields();
  TestUnknownEnumNames();
  TestRangesAreInclusive();
  TestTimestampAndAddress();
  TestCustomRanges();

  std::cout << "telemetry_unit_payload_validator: pass\n";
  return 0;
}
