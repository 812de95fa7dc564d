#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "internal/model/telemetry_enums.hpp"

namespace telemetry::model {

enum class AlertPhase : std::uint8_t {
  kArmed   = 0,
  kCooling = 1,
};

/*
  Cooldown state of one (device, direction) pair.

  There is no timer: COOLING -> ARMED is decided lazily from last_fired
  whenever the next sample is evaluated.
*/
constexpr AlertPhase PhaseAt(std::optional<std::chrono::system_clock::time_point> last_fired,
                             std::chrono::system_clock::time_point                now,
                             std::chrono::system_clock::duration                  cooldown) {
  if (!last_fired) {
    return AlertPhase::kArmed;
  }
  return now - *last_fired >= cooldown ? AlertPhase::kArmed : AlertPhase::kCooling;
}

} // namespace telemetry::model
