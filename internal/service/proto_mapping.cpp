#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace telemetry::service {

namespace {

void SetIfKnown(uint64_t ms, google::protobuf::Timestamp* out) {
  if (ms != 0) *out = util::ToProto(util::FromUnixMillis(ms));
}

} // namespace

telemetry::gate::core::v1::TelemetrySample ToProto(const db::model::SampleRecord& r) {
  telemetry::gate::core::v1::TelemetrySample p;
  p.set_id(r.id);
  p.set_serial(r.serial);
  p.set_mode(r.mode);
  p.set_setpoint_c(r.setpoint_c);
  p.set_temp_inside_c(r.temp_inside_c);
  if (r.temp_outside_c) p.set_temp_outside_c(*r.temp_outside_c);
  if (r.humidity_percent) p.set_humidity_percent(*r.humidity_percent);
  p.set_hysteresis_c(r.hysteresis_c);
  p.set_output(r.output);
  SetIfKnown(r.device_ts_ms, p.mutable_device_timestamp());
  SetIfKnown(r.received_at_ms, p.mutable_received_at());
  p.set_raw_payload(r.raw_payload);
  return p;
}

telemetry::gate::device::v1::Device ToProto(const db::model::DeviceRecord& r) {
  telemetry::gate::device::v1::Device p;
  p.set_serial(r.serial);
  p.set_owner_id(r.owner_id);
  p.set_name(r.name);
  SetIfKnown(r.created_at_ms, p.mutable_created_at());
  SetIfKnown(r.last_seen_ms, p.mutable_last_seen());
  p.set_last_ip(r.last_ip);
  return p;
}

telemetry::gate::device::v1::CredentialInfo ToProto(const db::model::CredentialRecord& r) {
  telemetry::gate::device::v1::CredentialInfo p;
  p.set_id(r.id);
  p.set_serial(r.serial);
  SetIfKnown(r.created_at_ms, p.mutable_created_at());
  SetIfKnown(r.expires_at_ms, p.mutable_expires_at());
  p.set_active(r.active);
  return p;
}

telemetry::gate::device::v1::AlertSettings ToProto(const db::model::AlertSettingsRecord& r) {
  telemetry::gate::device::v1::AlertSettings p;
  p.set_serial(r.serial);
  p.set_alerts_enabled(r.alerts_enabled);
  p.set_high_temp_enabled(r.high_enabled);
  p.set_high_temp_threshold_c(r.high_threshold_c);
  p.set_low_temp_enabled(r.low_enabled);
  p.set_low_temp_threshold_c(r.low_threshold_c);
  p.set_cooldown_minutes(r.cooldown_minutes);
  p.set_recipient(r.recipient);
  return p;
}

db::model::AlertSettingsRecord FromProto(const telemetry::gate::device::v1::AlertSettings& p) {
  db::model::AlertSettingsRecord r;
  r.serial           = p.serial();
  r.alerts_enabled   = p.alerts_enabled();
  r.high_enabled     = p.high_temp_enabled();
  r.high_threshold_c = p.high_temp_threshold_c();
  r.low_enabled      = p.low_temp_enabled();
  r.low_threshold_c  = p.low_temp_threshold_c();
  r.cooldown_minutes = p.cooldown_minutes();
  r.recipient        = p.recipient();
  return r;
}

telemetry::gate::device::v1::StorageProfile ToProto(const db::model::StorageProfileRecord& r, const quota::PlanCeilings& ceilings) {
  telemetry::gate::device::v1::StorageProfile p;
  p.set_owner_id(r.owner_id);
  p.set_plan(r.plan);
  p.set_usage_bytes(r.usage_bytes);
  p.set_limit_bytes(ceilings.For(r.plan));
  p.set_storage_full(r.usage_bytes >= ceilings.For(r.plan));
  SetIfKnown(r.usage_recomputed_at_ms, p.mutable_usage_recomputed_at());
  return p;
}

} // namespace telemetry::service
