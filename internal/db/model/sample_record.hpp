#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::db::model {

/*
  Persistent telemetry row. Append-only.

  received_at_ms is assigned by the store inside the write transaction and
  is the authoritative ordering key (ties broken by id).
*/
struct SampleRecord {
  uint64_t    id = 0;  // assigned by the backend on insert
  std::string serial;

  telemetry::gate::core::v1::Mode mode = telemetry::gate::core::v1::MODE_UNSPECIFIED;

  double setpoint_c    = 0.0;
  double temp_inside_c = 0.0;

  std::optional<double> temp_outside_c;
  std::optional<double> humidity_percent;

  double hysteresis_c = 0.5;

  telemetry::gate::core::v1::Output output = telemetry::gate::core::v1::OUTPUT_UNSPECIFIED;

  // device clock, 0 = not reported
  uint64_t device_ts_ms   = 0;
  uint64_t received_at_ms = 0;

  std::string raw_payload;
};

}
