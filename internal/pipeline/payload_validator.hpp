#pragma once

#include <string>

#include "internal/db/model/sample_record.hpp"
#include "telemetry/gate/services/v1/telemetry_ingest_service.pb.h"

namespace telemetry::pipeline {

// Inclusive bounds.
struct ValidationRanges {
  double setpoint_min_c = 5.0;
  double setpoint_max_c = 35.0;

  double inside_min_c = -40.0;
  double inside_max_c = 85.0;

  double outside_min_c = -60.0;
  double outside_max_c = 70.0;

  double humidity_min_percent = 0.0;
  double humidity_max_percent = 100.0;

  double hysteresis_min_c     = 0.1;
  double hysteresis_max_c     = 5.0;
  double hysteresis_default_c = 0.5;
};

/*
  Turns a device body into a storable sample or throws ValidationFailure
  naming the first offending field. Pure: no clock, no storage.
*/
class PayloadValidator {
 public:
  explicit PayloadValidator(ValidationRanges ranges = {});

  db::model::SampleRecord Validate(const telemetry::gate::services::v1::TelemetryBody& body, const std::string& serial,
                                   const std::string& raw_payload) const;

  const ValidationRanges& ranges() const {
    return ranges_;
  }

 private:
  ValidationRanges ranges_;
};

} // namespace telemetry::pipeline
