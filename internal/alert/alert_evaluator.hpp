#pragma once

#include <memory>
#include <vector>

#include "cooldown_table.hpp"
#include "fired_alert.hpp"
#include "internal/db/api/repository.hpp"

namespace telemetry::alert {

// Settings used for devices that have no stored row.
struct AlertDefaults {
  double   high_threshold_c = 30.0;
  double   low_threshold_c  = 10.0;
  uint32_t cooldown_minutes = 30;

  db::model::AlertSettingsRecord For(const std::string& serial) const;
};

/*
  Threshold check of one persisted sample.

  HIGH fires on inside >= high threshold, LOW on inside <= low threshold,
  each only if alerts and that direction are enabled and the pair is ARMED.
  Both directions are evaluated on every sample.
*/
class AlertEvaluator {
 public:
  AlertEvaluator(std::shared_ptr<db::Repository> repository, std::shared_ptr<CooldownTable> cooldowns,
                 std::shared_ptr<util::ClockSource> clock, AlertDefaults defaults);

  std::vector<FiredAlert> Evaluate(const std::string& owner_id, const std::string& device_name, const db::model::SampleRecord& sample);

  // Pure threshold test, no cooldown.
  static bool Breaches(const db::model::AlertSettingsRecord& settings, telemetry::gate::core::v1::AlertDirection direction, double temp_c);

  const AlertDefaults& defaults() const {
    return defaults_;
  }

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<CooldownTable>     cooldowns_;
  std::shared_ptr<util::ClockSource> clock_;
  AlertDefaults                      defaults_;
};

} // namespace telemetry::alert
