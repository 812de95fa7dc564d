#pragma once

#include <cstdint>
#include <string>

namespace telemetry::db::model {

struct AlertSettingsRecord {
  std::string serial;

  // opt-in: nothing fires until the owner turns alerts on
  bool alerts_enabled = false;

  bool   high_enabled     = false;
  double high_threshold_c = 30.0;

  bool   low_enabled     = false;
  double low_threshold_c = 10.0;

  uint32_t cooldown_minutes = 30;

  // empty = owner's contact email
  std::string recipient;
};

}
