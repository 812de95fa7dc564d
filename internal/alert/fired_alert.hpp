#pragma once

#include <cstdint>
#include <string>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::alert {

// Everything the notifier needs; no further lookups after evaluation.
struct FiredAlert {
  std::string serial;
  std::string device_name;
  std::string owner_id;

  // custom address or owner email; empty = undeliverable
  std::string recipient;

  telemetry::gate::core::v1::AlertDirection direction = telemetry::gate::core::v1::ALERT_DIRECTION_UNSPECIFIED;

  double threshold_c   = 0.0;
  double temp_inside_c = 0.0;

  uint64_t sample_id      = 0;
  uint64_t received_at_ms = 0;
};

} // namespace telemetry::alert
