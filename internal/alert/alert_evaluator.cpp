#include "alert_evaluator.hpp"

#include "internal/model/telemetry_enums.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace telemetry::alert {

using telemetry::gate::core::v1::ALERT_DIRECTION_HIGH;
using telemetry::gate::core::v1::ALERT_DIRECTION_LOW;
using telemetry::gate::core::v1::AlertDirection;

db::model::AlertSettingsRecord AlertDefaults::For(const std::string& serial) const {
  db::model::AlertSettingsRecord settings;
  settings.serial           = serial;
  settings.high_threshold_c = high_threshold_c;
  settings.low_threshold_c  = low_threshold_c;
  settings.cooldown_minutes = cooldown_minutes;
  return settings;
}

AlertEvaluator::AlertEvaluator(std::shared_ptr<db::Repository> repository, std::shared_ptr<CooldownTable> cooldowns,
                               std::shared_ptr<util::ClockSource> clock, AlertDefaults defaults)
    : repository_(std::move(repository)), cooldowns_(std::move(cooldowns)), clock_(std::move(clock)), defaults_(defaults) {
}

bool AlertEvaluator::Breaches(const db::model::AlertSettingsRecord& settings, AlertDirection direction, double temp_c) {
  if (!settings.alerts_enabled) return false;

  switch (direction) {
    case ALERT_DIRECTION_HIGH:
      return settings.high_enabled && temp_c >= settings.high_threshold_c;
    case ALERT_DIRECTION_LOW:
      return settings.low_enabled && temp_c <= settings.low_threshold_c;
    default:
      return false;
  }
}

std::vector<FiredAlert> AlertEvaluator::Evaluate(const std::string& owner_id, const std::string& device_name,
                                                 const db::model::SampleRecord& sample) {
  observability::SpanScope span("AlertEvaluator.Evaluate");

  std::optional<db::model::AlertSettingsRecord> stored;
  std::optional<db::model::AccountRecord>       owner;
  {
    auto tx = repository_->Begin();
    stored  = repository_->GetAlertSettings(*tx, sample.serial);
    tx->Commit();
  }
  const auto settings = stored ? *stored : defaults_.For(sample.serial);

  const auto now      = clock_->Now();
  const auto cooldown = std::chrono::minutes(settings.cooldown_minutes);

  std::vector<FiredAlert> fired;
  for (auto direction : {ALERT_DIRECTION_HIGH, ALERT_DIRECTION_LOW}) {
    if (!Breaches(settings, direction, sample.temp_inside_c)) continue;
    if (!cooldowns_->TryFire({sample.serial, direction}, now, cooldown)) continue;

    FiredAlert alert;
    alert.serial         = sample.serial;
    alert.device_name    = device_name;
    alert.owner_id       = owner_id;
    alert.recipient      = settings.recipient;
    alert.direction      = direction;
    alert.threshold_c    = direction == ALERT_DIRECTION_HIGH ? settings.high_threshold_c : settings.low_threshold_c;
    alert.temp_inside_c  = sample.temp_inside_c;
    alert.sample_id      = sample.id;
    alert.received_at_ms = sample.received_at_ms;
    fired.push_back(std::move(alert));

    observability::Metrics::Instance().RecordAlertFired(model::ToString(direction));
    TELEMETRY_LOG_INFO("alert fired", {observability::StringField("serial", sample.serial),
                                       observability::StringField("direction", model::ToString(direction)),
                                       observability::DoubleField("temp_inside_c", sample.temp_inside_c)});
  }

  // Owner email is only needed when something fired without a custom recipient.
  for (auto& alert : fired) {
    if (!alert.recipient.empty()) continue;
    if (!owner) {
      auto tx = repository_->Begin();
      owner   = repository_->GetAccount(*tx, owner_id);
      tx->Commit();
      if (!owner) owner = db::model::AccountRecord{owner_id, ""};
    }
    alert.recipient = owner->email;
  }

  span.SetAttribute("alerts.fired", static_cast<std::int64_t>(fired.size()));
  return fired;
}

} // namespace telemetry::alert
