#pragma once

#include <cstdint>
#include <string>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::db::model {

struct AlertStateRecord {
  std::string serial;

  telemetry::gate::core::v1::AlertDirection direction = telemetry::gate::core::v1::ALERT_DIRECTION_UNSPECIFIED;

  uint64_t last_fired_ms = 0;
};

}
