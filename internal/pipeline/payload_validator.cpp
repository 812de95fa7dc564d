#include "payload_validator.hpp"

#include <cmath>
#include <cstdio>

#include "internal/model/telemetry_enums.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace telemetry::pipeline {

namespace {

constexpr std::size_t kMaxDeviceIpSize = 64;

std::string Bound(double v) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%g", v);
  return buffer;
}

double RequireInRange(const char* field, double value, double lo, double hi) {
  if (!std::isfinite(value) || value < lo || value > hi) {
    throw util::ValidationFailure(std::string(field) + " must be between " + Bound(lo) + " and " + Bound(hi));
  }
  return value;
}

} // namespace

PayloadValidator::PayloadValidator(ValidationRanges ranges) : ranges_(ranges) {
}

db::model::SampleRecord PayloadValidator::Validate(const telemetry::gate::services::v1::TelemetryBody& body, const std::string& serial,
                                                   const std::string& raw_payload) const {
  if (body.mode().empty()) throw util::ValidationFailure("missing required field: mode");
  if (!body.has_setpoint_c()) throw util::ValidationFailure("missing required field: setpoint_c");
  if (!body.has_temp_inside_c()) throw util::ValidationFailure("missing required field: temp_inside_c");
  if (body.output().empty()) throw util::ValidationFailure("missing required field: output");

  const auto mode = model::ParseMode(body.mode());
  if (!mode) throw util::ValidationFailure("unknown mode: " + body.mode());

  const auto output = model::ParseOutput(body.output());
  if (!output) throw util::ValidationFailure("unknown output: " + body.output());

  db::model::SampleRecord sample;
  sample.serial        = serial;
  sample.mode          = *mode;
  sample.output        = *output;
  sample.setpoint_c    = RequireInRange("setpoint_c", body.setpoint_c(), ranges_.setpoint_min_c, ranges_.setpoint_max_c);
  sample.temp_inside_c = RequireInRange("temp_inside_c", body.temp_inside_c(), ranges_.inside_min_c, ranges_.inside_max_c);

  if (body.has_temp_outside_c()) {
    sample.temp_outside_c = RequireInRange("temp_outside_c", body.temp_outside_c(), ranges_.outside_min_c, ranges_.outside_max_c);
  }
  if (body.has_humidity_percent()) {
    sample.humidity_percent =
        RequireInRange("humidity_percent", body.humidity_percent(), ranges_.humidity_min_percent, ranges_.humidity_max_percent);
  }

  sample.hysteresis_c = body.has_hysteresis_c()
                            ? RequireInRange("hysteresis_c", body.hysteresis_c(), ranges_.hysteresis_min_c, ranges_.hysteresis_max_c)
                            : ranges_.hysteresis_default_c;

  if (!body.timestamp().empty()) {
    const auto device_ts = util::ParseRfc3339(body.timestamp());
    if (!device_ts) throw util::ValidationFailure("timestamp must be RFC 3339: " + body.timestamp());
    if (*device_ts < util::TimePoint{}) throw util::ValidationFailure("timestamp before 1970 is not supported");
    sample.device_ts_ms = util::ToUnixMillis(*device_ts);
  }

  if (body.device_ip().size() > kMaxDeviceIpSize) throw util::ValidationFailure("device_ip too long");

  sample.raw_payload = raw_payload;
  return sample;
}

} // namespace telemetry::pipeline
