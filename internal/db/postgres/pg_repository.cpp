#include "pg_repository.hpp"

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::db::postgres {

namespace {

constexpr const char* kSampleColumns =
    "id,serial,mode,setpoint_c,temp_inside_c,temp_outside_c,humidity_percent,hysteresis_c,output,device_ts_ms,received_at_ms,raw_payload";

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<double> OptionalDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

model::SampleRecord ReadSample(const pqxx::row& row) {
  model::SampleRecord r;
  r.id               = row[0].as<uint64_t>();
  r.serial           = row[1].c_str();
  r.mode             = static_cast<telemetry::gate::core::v1::Mode>(row[2].as<int>());
  r.setpoint_c       = row[3].as<double>();
  r.temp_inside_c    = row[4].as<double>();
  r.temp_outside_c   = OptionalDouble(row[5]);
  r.humidity_percent = OptionalDouble(row[6]);
  r.hysteresis_c     = row[7].as<double>();
  r.output           = static_cast<telemetry::gate::core::v1::Output>(row[8].as<int>());
  r.device_ts_ms     = row[9].as<uint64_t>();
  r.received_at_ms   = row[10].as<uint64_t>();
  r.raw_payload      = row[11].c_str();
  return r;
}

model::CredentialRecord ReadCredential(const pqxx::row& row) {
  model::CredentialRecord r;
  r.id            = row[0].as<uint64_t>();
  r.serial        = row[1].c_str();
  r.salt_hex      = row[2].c_str();
  r.hash_hex      = row[3].c_str();
  r.created_at_ms = row[4].as<uint64_t>();
  r.expires_at_ms = row[5].as<uint64_t>();
  r.active        = row[6].as<bool>();
  return r;
}

model::StorageProfileRecord ReadProfile(const pqxx::row& row) {
  model::StorageProfileRecord r;
  r.owner_id               = row[0].c_str();
  r.plan                   = static_cast<telemetry::gate::core::v1::StoragePlan>(row[1].as<int>());
  r.usage_bytes            = row[2].as<uint64_t>();
  r.usage_recomputed_at_ms = row[3].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result PgRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO accounts(id,email) VALUES($1,$2) ON CONFLICT(id) DO UPDATE SET email=EXCLUDED.email;", r.id, r.email);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT id,email FROM accounts WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  model::AccountRecord r;
  r.id    = res[0][0].c_str();
  r.email = res[0][1].c_str();
  return r;
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result PgRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO devices(serial,owner_id,name,created_at_ms,last_seen_ms,last_ip) VALUES($1,$2,$3,$4,$5,$6);", r.serial,
                             r.owner_id, r.name, I64(r.created_at_ms), I64(r.last_seen_ms), r.last_ip);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::GetDevice(Transaction& t, const std::string& serial) {
  auto res = TX(t).Work().exec_prepared("get_device", serial);
  if (res.empty()) return std::nullopt;

  model::DeviceRecord r;
  r.serial        = res[0][0].c_str();
  r.owner_id      = res[0][1].c_str();
  r.name          = res[0][2].c_str();
  r.created_at_ms = res[0][3].as<uint64_t>();
  r.last_seen_ms  = res[0][4].as<uint64_t>();
  r.last_ip       = res[0][5].c_str();
  return r;
}

Result PgRepository::RenameDevice(Transaction& t, const std::string& serial, const std::string& name) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE devices SET name=$2 WHERE serial=$1;", serial, name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TouchDevice(Transaction& t, const std::string& serial, uint64_t seen_ms, const std::string& ip) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_device", serial, I64(seen_ms), ip);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result PgRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO device_credentials(serial,salt_hex,hash_hex,created_at_ms,expires_at_ms,active) VALUES($1,$2,$3,$4,$5,$6) RETURNING id;",
        r.serial, r.salt_hex, r.hash_hex, I64(r.created_at_ms), I64(r.expires_at_ms), r.active);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CredentialRecord> PgRepository::GetActiveCredential(Transaction& t, const std::string& serial) {
  auto res = TX(t).Work().exec_prepared("get_active_credential", serial);
  if (res.empty()) return std::nullopt;
  return ReadCredential(res[0]);
}

std::optional<model::ActiveCredential> PgRepository::GetActiveCredentialWithDevice(Transaction& t, const std::string& serial) {
  auto res = TX(t).Work().exec_prepared("get_active_credential_with_device", serial);
  if (res.empty()) return std::nullopt;

  model::ActiveCredential r;
  r.credential           = ReadCredential(res[0]);
  r.device.serial        = r.credential.serial;
  r.device.owner_id      = res[0][7].c_str();
  r.device.name          = res[0][8].c_str();
  r.device.created_at_ms = res[0][9].as<uint64_t>();
  r.device.last_seen_ms  = res[0][10].as<uint64_t>();
  r.device.last_ip       = res[0][11].c_str();
  return r;
}

std::vector<model::CredentialRecord> PgRepository::ListCredentials(Transaction& t, const std::string& serial) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,serial,salt_hex,hash_hex,created_at_ms,expires_at_ms,active FROM device_credentials WHERE serial=$1 ORDER BY id;", serial);

  std::vector<model::CredentialRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCredential(row));
  return out;
}

Result PgRepository::DeactivateCredentials(Transaction& t, const std::string& serial, uint64_t& deactivated) {
  deactivated = 0;
  try {
    auto res    = TX(t).Work().exec_params("UPDATE device_credentials SET active=FALSE WHERE serial=$1 AND active;", serial);
    deactivated = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result PgRepository::AppendSample(Transaction& t, model::SampleRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_sample", r.serial, static_cast<int>(r.mode), r.setpoint_c, r.temp_inside_c, r.temp_outside_c,
                                          r.humidity_percent, r.hysteresis_c, static_cast<int>(r.output), I64(r.device_ts_ms),
                                          I64(r.received_at_ms), r.raw_payload);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SampleRecord> PgRepository::ReadSamplesRange(Transaction& t, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                                uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSampleColumns +
                                          " FROM telemetry_samples WHERE serial=$1 AND received_at_ms>=$2 AND received_at_ms<$3 "
                                          "ORDER BY received_at_ms, id LIMIT $4;",
                                      serial, I64(start_ms), I64(end_ms), static_cast<int64_t>(limit));

  std::vector<model::SampleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSample(row));
  return out;
}

std::vector<model::SampleRecord> PgRepository::ReadRecentSamples(Transaction& t, const std::string& serial, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSampleColumns +
                                          " FROM telemetry_samples WHERE serial=$1 ORDER BY received_at_ms DESC, id DESC LIMIT $2;",
                                      serial, static_cast<int64_t>(limit));

  std::vector<model::SampleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSample(row));
  return out;
}

model::OwnerUsageStats PgRepository::GetOwnerUsageStats(Transaction& t, const std::string& owner_id, uint32_t average_window) {
  auto& work = TX(t).Work();

  model::OwnerUsageStats stats;
  auto count = work.exec_params("SELECT COUNT(*) FROM telemetry_samples s JOIN devices d ON d.serial=s.serial WHERE d.owner_id=$1;", owner_id);
  stats.sample_count = count[0][0].as<uint64_t>();
  if (stats.sample_count == 0 || average_window == 0) return stats;

  auto avg = work.exec_params(
      "SELECT AVG(len) FROM (SELECT OCTET_LENGTH(s.raw_payload) AS len FROM telemetry_samples s JOIN devices d ON d.serial=s.serial "
      "WHERE d.owner_id=$1 ORDER BY s.received_at_ms DESC, s.id DESC LIMIT $2) newest;",
      owner_id, static_cast<int64_t>(average_window));
  if (!avg.empty() && !avg[0][0].is_null()) stats.average_payload_bytes = avg[0][0].as<double>();
  return stats;
}

// ------------------------------------------------------------------
// Storage profiles
// ------------------------------------------------------------------

std::optional<model::StorageProfileRecord> PgRepository::GetStorageProfile(Transaction& t, const std::string& owner_id) {
  auto res = TX(t).Work().exec_prepared("get_storage_profile", owner_id);
  if (res.empty()) return std::nullopt;
  return ReadProfile(res[0]);
}

std::vector<model::StorageProfileRecord> PgRepository::ListStorageProfiles(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT owner_id,plan,usage_bytes,usage_recomputed_at_ms FROM storage_profiles ORDER BY owner_id;");

  std::vector<model::StorageProfileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadProfile(row));
  return out;
}

Result PgRepository::UpsertStorageProfile(Transaction& t, const model::StorageProfileRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(owner_id) DO UPDATE SET plan=EXCLUDED.plan,usage_bytes=EXCLUDED.usage_bytes,"
        "usage_recomputed_at_ms=EXCLUDED.usage_recomputed_at_ms;",
        r.owner_id, static_cast<int>(r.plan), I64(r.usage_bytes), I64(r.usage_recomputed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AddStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes) {
  try {
    TX(t).Work().exec_prepared("add_storage_usage", owner_id, static_cast<int>(telemetry::gate::core::v1::STORAGE_PLAN_FREE), I64(bytes));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) {
  try {
    TX(t).Work().exec_prepared("set_storage_usage", owner_id, static_cast<int>(telemetry::gate::core::v1::STORAGE_PLAN_FREE), I64(bytes),
                               I64(recomputed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetStoragePlan(Transaction& t, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) {
  try {
    TX(t).Work().exec_prepared("set_storage_plan", owner_id, static_cast<int>(plan));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Alerts
// ------------------------------------------------------------------

std::optional<model::AlertSettingsRecord> PgRepository::GetAlertSettings(Transaction& t, const std::string& serial) {
  auto res = TX(t).Work().exec_prepared("get_alert_settings", serial);
  if (res.empty()) return std::nullopt;

  model::AlertSettingsRecord r;
  r.serial           = res[0][0].c_str();
  r.alerts_enabled   = res[0][1].as<bool>();
  r.high_enabled     = res[0][2].as<bool>();
  r.high_threshold_c = res[0][3].as<double>();
  r.low_enabled      = res[0][4].as<bool>();
  r.low_threshold_c  = res[0][5].as<double>();
  r.cooldown_minutes = res[0][6].as<uint32_t>();
  r.recipient        = res[0][7].c_str();
  return r;
}

Result PgRepository::UpsertAlertSettings(Transaction& t, const model::AlertSettingsRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO alert_settings(serial,alerts_enabled,high_enabled,high_threshold_c,low_enabled,low_threshold_c,cooldown_minutes,recipient) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(serial) DO UPDATE SET alerts_enabled=EXCLUDED.alerts_enabled,"
        "high_enabled=EXCLUDED.high_enabled,high_threshold_c=EXCLUDED.high_threshold_c,low_enabled=EXCLUDED.low_enabled,"
        "low_threshold_c=EXCLUDED.low_threshold_c,cooldown_minutes=EXCLUDED.cooldown_minutes,recipient=EXCLUDED.recipient;",
        r.serial, r.alerts_enabled, r.high_enabled, r.high_threshold_c, r.low_enabled, r.low_threshold_c, static_cast<int>(r.cooldown_minutes),
        r.recipient);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertAlertState(Transaction& t, const model::AlertStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_alert_state", r.serial, static_cast<int>(r.direction), I64(r.last_fired_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AlertStateRecord> PgRepository::ListAlertStates(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT serial,direction,last_fired_ms FROM alert_states ORDER BY serial,direction;");

  std::vector<model::AlertStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AlertStateRecord r;
    r.serial        = row[0].c_str();
    r.direction     = static_cast<telemetry::gate::core::v1::AlertDirection>(row[1].as<int>());
    r.last_fired_ms = row[2].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace telemetry::db::postgres
