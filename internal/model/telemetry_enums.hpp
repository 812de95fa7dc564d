#pragma once

#include <optional>
#include <string_view>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::model {

using telemetry::gate::core::v1::AlertDirection;
using telemetry::gate::core::v1::Mode;
using telemetry::gate::core::v1::Output;
using telemetry::gate::core::v1::StoragePlan;

/*
  Wire names used by devices ("HEAT", "COOL_ON", ...). Parsing is exact and
  case-sensitive.
*/

constexpr std::string_view ToString(Mode mode) {
  switch (mode) {
    case telemetry::gate::core::v1::MODE_OFF:
      return "OFF";
    case telemetry::gate::core::v1::MODE_HEAT:
      return "HEAT";
    case telemetry::gate::core::v1::MODE_COOL:
      return "COOL";
    case telemetry::gate::core::v1::MODE_AUTO:
      return "AUTO";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view ToString(Output output) {
  switch (output) {
    case telemetry::gate::core::v1::OUTPUT_OFF:
      return "OFF";
    case telemetry::gate::core::v1::OUTPUT_HEAT_ON:
      return "HEAT_ON";
    case telemetry::gate::core::v1::OUTPUT_COOL_ON:
      return "COOL_ON";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view ToString(AlertDirection direction) {
  switch (direction) {
    case telemetry::gate::core::v1::ALERT_DIRECTION_HIGH:
      return "high";
    case telemetry::gate::core::v1::ALERT_DIRECTION_LOW:
      return "low";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(StoragePlan plan) {
  switch (plan) {
    case telemetry::gate::core::v1::STORAGE_PLAN_FREE:
      return "free";
    case telemetry::gate::core::v1::STORAGE_PLAN_STANDARD:
      return "standard";
    case telemetry::gate::core::v1::STORAGE_PLAN_PREMIUM:
      return "premium";
    default:
      return "unspecified";
  }
}

inline std::optional<Mode> ParseMode(std::string_view text) {
  for (auto mode : {telemetry::gate::core::v1::MODE_OFF, telemetry::gate::core::v1::MODE_HEAT, telemetry::gate::core::v1::MODE_COOL,
                    telemetry::gate::core::v1::MODE_AUTO}) {
    if (ToString(mode) == text) return mode;
  }
  return std::nullopt;
}

inline std::optional<Output> ParseOutput(std::string_view text) {
  for (auto output : {telemetry::gate::core::v1::OUTPUT_OFF, telemetry::gate::core::v1::OUTPUT_HEAT_ON, telemetry::gate::core::v1::OUTPUT_COOL_ON}) {
    if (ToString(output) == text) return output;
  }
  return std::nullopt;
}

inline std::optional<StoragePlan> ParsePlan(std::string_view text) {
  for (auto plan : {telemetry::gate::core::v1::STORAGE_PLAN_FREE, telemetry::gate::core::v1::STORAGE_PLAN_STANDARD,
                    telemetry::gate::core::v1::STORAGE_PLAN_PREMIUM}) {
    if (ToString(plan) == text) return plan;
  }
  return std::nullopt;
}

} // namespace telemetry::model
