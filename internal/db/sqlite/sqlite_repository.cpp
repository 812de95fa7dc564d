#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace telemetry::db::sqlite {

using telemetry::db::ErrorCode;
using telemetry::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kSampleColumns =
    "id,serial,mode,setpoint_c,temp_inside_c,temp_outside_c,humidity_percent,hysteresis_c,output,device_ts_ms,received_at_ms,raw_payload";

// Reads throw on backend failure; writes report through Result.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st, &sqlite3_finalize);
}

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        return Statement(nullptr, &sqlite3_finalize);
    }
    return Statement(st, &sqlite3_finalize);
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

void BindOptionalDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

std::optional<double> ColOptionalDouble(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

model::SampleRecord ReadSample(sqlite3_stmt* st) {
    model::SampleRecord r;
    r.id               = ColU64(st, 0);
    r.serial           = ColText(st, 1);
    r.mode             = static_cast<telemetry::gate::core::v1::Mode>(ColI32(st, 2));
    r.setpoint_c       = ColDouble(st, 3);
    r.temp_inside_c    = ColDouble(st, 4);
    r.temp_outside_c   = ColOptionalDouble(st, 5);
    r.humidity_percent = ColOptionalDouble(st, 6);
    r.hysteresis_c     = ColDouble(st, 7);
    r.output           = static_cast<telemetry::gate::core::v1::Output>(ColI32(st, 8));
    r.device_ts_ms     = ColU64(st, 9);
    r.received_at_ms   = ColU64(st, 10);
    r.raw_payload      = ColText(st, 11);
    return r;
}

model::CredentialRecord ReadCredential(sqlite3_stmt* st) {
    model::CredentialRecord r;
    r.id            = ColU64(st, 0);
    r.serial        = ColText(st, 1);
    r.salt_hex      = ColText(st, 2);
    r.hash_hex      = ColText(st, 3);
    r.created_at_ms = ColU64(st, 4);
    r.expires_at_ms = ColU64(st, 5);
    r.active        = ColI32(st, 6) != 0;
    return r;
}

model::StorageProfileRecord ReadProfile(sqlite3_stmt* st) {
    model::StorageProfileRecord r;
    r.owner_id               = ColText(st, 0);
    r.plan                   = static_cast<telemetry::gate::core::v1::StoragePlan>(ColI32(st, 1));
    r.usage_bytes            = ColU64(st, 2);
    r.usage_recomputed_at_ms = ColU64(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT INTO accounts(id,email) VALUES(?,?) ON CONFLICT(id) DO UPDATE SET email=excluded.email;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.email);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AccountRecord> SqliteRepository::GetAccount(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT id,email FROM accounts WHERE id=?;");
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::AccountRecord r;
    r.id    = ColText(st.get(), 0);
    r.email = ColText(st.get(), 1);
    return r;
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT INTO devices(serial,owner_id,name,created_at_ms,last_seen_ms,last_ip) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.serial);
    BindText(st.get(), 2, r.owner_id);
    BindText(st.get(), 3, r.name);
    BindU64(st.get(), 4, r.created_at_ms);
    BindU64(st.get(), 5, r.last_seen_ms);
    BindText(st.get(), 6, r.last_ip);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& serial) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT serial,owner_id,name,created_at_ms,last_seen_ms,last_ip FROM devices WHERE serial=?;");
    BindText(st.get(), 1, serial);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::DeviceRecord r;
    r.serial        = ColText(st.get(), 0);
    r.owner_id      = ColText(st.get(), 1);
    r.name          = ColText(st.get(), 2);
    r.created_at_ms = ColU64(st.get(), 3);
    r.last_seen_ms  = ColU64(st.get(), 4);
    r.last_ip       = ColText(st.get(), 5);
    return r;
}

Result SqliteRepository::RenameDevice(Transaction& t, const std::string& serial, const std::string& name) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "UPDATE devices SET name=? WHERE serial=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, name);
    BindText(st.get(), 2, serial);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

Result SqliteRepository::TouchDevice(Transaction& t, const std::string& serial, uint64_t seen_ms, const std::string& ip) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "UPDATE devices SET last_seen_ms=?, last_ip=CASE WHEN ?='' THEN last_ip ELSE ? END WHERE serial=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, seen_ms);
    BindText(st.get(), 2, ip);
    BindText(st.get(), 3, ip);
    BindText(st.get(), 4, serial);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result SqliteRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT INTO device_credentials(serial,salt_hex,hash_hex,created_at_ms,expires_at_ms,active) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.serial);
    BindText(st.get(), 2, r.salt_hex);
    BindText(st.get(), 3, r.hash_hex);
    BindU64(st.get(), 4, r.created_at_ms);
    BindU64(st.get(), 5, r.expires_at_ms);
    BindI32(st.get(), 6, r.active ? 1 : 0);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::CredentialRecord> SqliteRepository::GetActiveCredential(Transaction& t, const std::string& serial) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db,
                              "SELECT id,serial,salt_hex,hash_hex,created_at_ms,expires_at_ms,active FROM device_credentials "
                              "WHERE serial=? AND active=1 ORDER BY id DESC LIMIT 1;");
    BindText(st.get(), 1, serial);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadCredential(st.get());
}

std::optional<model::ActiveCredential> SqliteRepository::GetActiveCredentialWithDevice(Transaction& t, const std::string& serial) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db,
                              "SELECT c.id,c.serial,c.salt_hex,c.hash_hex,c.created_at_ms,c.expires_at_ms,c.active,"
                              "d.owner_id,d.name,d.created_at_ms,d.last_seen_ms,d.last_ip FROM device_credentials c "
                              "JOIN devices d ON d.serial=c.serial WHERE c.serial=? AND c.active=1 ORDER BY c.id DESC LIMIT 1;");
    BindText(st.get(), 1, serial);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::ActiveCredential r;
    r.credential           = ReadCredential(st.get());
    r.device.serial        = r.credential.serial;
    r.device.owner_id      = ColText(st.get(), 7);
    r.device.name          = ColText(st.get(), 8);
    r.device.created_at_ms = ColU64(st.get(), 9);
    r.device.last_seen_ms  = ColU64(st.get(), 10);
    r.device.last_ip       = ColText(st.get(), 11);
    return r;
}

std::vector<model::CredentialRecord> SqliteRepository::ListCredentials(Transaction& t, const std::string& serial) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db,
                              "SELECT id,serial,salt_hex,hash_hex,created_at_ms,expires_at_ms,active FROM device_credentials "
                              "WHERE serial=? ORDER BY id;");
    BindText(st.get(), 1, serial);

    std::vector<model::CredentialRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadCredential(st.get()));
    return out;
}

Result SqliteRepository::DeactivateCredentials(Transaction& t, const std::string& serial, uint64_t& deactivated) {
    auto* db    = TX(t).Handle();
    deactivated = 0;
    auto st     = Prepare(db, "UPDATE device_credentials SET active=0 WHERE serial=? AND active=1;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, serial);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) deactivated = static_cast<uint64_t>(sqlite3_changes(db));
    return result;
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result SqliteRepository::AppendSample(Transaction& t, model::SampleRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO telemetry_samples(serial,mode,setpoint_c,temp_inside_c,temp_outside_c,humidity_percent,hysteresis_c,output,"
                       "device_ts_ms,received_at_ms,raw_payload) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.serial);
    BindI32(st.get(), 2, static_cast<int>(r.mode));
    BindDouble(st.get(), 3, r.setpoint_c);
    BindDouble(st.get(), 4, r.temp_inside_c);
    BindOptionalDouble(st.get(), 5, r.temp_outside_c);
    BindOptionalDouble(st.get(), 6, r.humidity_percent);
    BindDouble(st.get(), 7, r.hysteresis_c);
    BindI32(st.get(), 8, static_cast<int>(r.output));
    BindU64(st.get(), 9, r.device_ts_ms);
    BindU64(st.get(), 10, r.received_at_ms);
    BindText(st.get(), 11, r.raw_payload);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::SampleRecord> SqliteRepository::ReadSamplesRange(Transaction& t, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                                    uint32_t limit) {
    auto*             db  = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kSampleColumns +
                            " FROM telemetry_samples WHERE serial=? AND received_at_ms>=? AND received_at_ms<? ORDER BY received_at_ms, id LIMIT ?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, serial);
    BindU64(st.get(), 2, start_ms);
    BindU64(st.get(), 3, end_ms);
    BindU64(st.get(), 4, limit);

    std::vector<model::SampleRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadSample(st.get()));
    return out;
}

std::vector<model::SampleRecord> SqliteRepository::ReadRecentSamples(Transaction& t, const std::string& serial, uint32_t limit) {
    auto*             db  = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kSampleColumns +
                            " FROM telemetry_samples WHERE serial=? ORDER BY received_at_ms DESC, id DESC LIMIT ?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, serial);
    BindU64(st.get(), 2, limit);

    std::vector<model::SampleRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadSample(st.get()));
    return out;
}

model::OwnerUsageStats SqliteRepository::GetOwnerUsageStats(Transaction& t, const std::string& owner_id, uint32_t average_window) {
    auto* db = TX(t).Handle();

    model::OwnerUsageStats stats;
    {
        auto st = PrepareOrThrow(db,
                                 "SELECT COUNT(*) FROM telemetry_samples s JOIN devices d ON d.serial=s.serial WHERE d.owner_id=?;");
        BindText(st.get(), 1, owner_id);
        if (StepRow(db, st.get())) stats.sample_count = ColU64(st.get(), 0);
    }

    if (stats.sample_count == 0 || average_window == 0) return stats;

    auto st = PrepareOrThrow(db,
                             "SELECT AVG(len) FROM (SELECT LENGTH(CAST(s.raw_payload AS BLOB)) AS len FROM telemetry_samples s "
                             "JOIN devices d ON d.serial=s.serial WHERE d.owner_id=? ORDER BY s.received_at_ms DESC, s.id DESC LIMIT ?);");
    BindText(st.get(), 1, owner_id);
    BindU64(st.get(), 2, average_window);
    if (StepRow(db, st.get())) stats.average_payload_bytes = ColDouble(st.get(), 0);
    return stats;
}

// ------------------------------------------------------------------
// Storage profiles
// ------------------------------------------------------------------

std::optional<model::StorageProfileRecord> SqliteRepository::GetStorageProfile(Transaction& t, const std::string& owner_id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT owner_id,plan,usage_bytes,usage_recomputed_at_ms FROM storage_profiles WHERE owner_id=?;");
    BindText(st.get(), 1, owner_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadProfile(st.get());
}

std::vector<model::StorageProfileRecord> SqliteRepository::ListStorageProfiles(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT owner_id,plan,usage_bytes,usage_recomputed_at_ms FROM storage_profiles ORDER BY owner_id;");

    std::vector<model::StorageProfileRecord> out;
    while (StepRow(db, st.get())) out.push_back(ReadProfile(st.get()));
    return out;
}

Result SqliteRepository::UpsertStorageProfile(Transaction& t, const model::StorageProfileRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES(?,?,?,?) "
                       "ON CONFLICT(owner_id) DO UPDATE SET plan=excluded.plan,usage_bytes=excluded.usage_bytes,"
                       "usage_recomputed_at_ms=excluded.usage_recomputed_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.owner_id);
    BindI32(st.get(), 2, static_cast<int>(r.plan));
    BindU64(st.get(), 3, r.usage_bytes);
    BindU64(st.get(), 4, r.usage_recomputed_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::AddStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES(?,?,?,0) "
                       "ON CONFLICT(owner_id) DO UPDATE SET usage_bytes=usage_bytes+excluded.usage_bytes;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, owner_id);
    BindI32(st.get(), 2, static_cast<int>(telemetry::gate::core::v1::STORAGE_PLAN_FREE));
    BindU64(st.get(), 3, bytes);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SetStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES(?,?,?,?) "
                       "ON CONFLICT(owner_id) DO UPDATE SET usage_bytes=excluded.usage_bytes,"
                       "usage_recomputed_at_ms=excluded.usage_recomputed_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, owner_id);
    BindI32(st.get(), 2, static_cast<int>(telemetry::gate::core::v1::STORAGE_PLAN_FREE));
    BindU64(st.get(), 3, bytes);
    BindU64(st.get(), 4, recomputed_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SetStoragePlan(Transaction& t, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES(?,?,0,0) "
                       "ON CONFLICT(owner_id) DO UPDATE SET plan=excluded.plan;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, owner_id);
    BindI32(st.get(), 2, static_cast<int>(plan));
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Alerts
// ------------------------------------------------------------------

std::optional<model::AlertSettingsRecord> SqliteRepository::GetAlertSettings(Transaction& t, const std::string& serial) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db,
                              "SELECT serial,alerts_enabled,high_enabled,high_threshold_c,low_enabled,low_threshold_c,cooldown_minutes,recipient "
                              "FROM alert_settings WHERE serial=?;");
    BindText(st.get(), 1, serial);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::AlertSettingsRecord r;
    r.serial           = ColText(st.get(), 0);
    r.alerts_enabled   = ColI32(st.get(), 1) != 0;
    r.high_enabled     = ColI32(st.get(), 2) != 0;
    r.high_threshold_c = ColDouble(st.get(), 3);
    r.low_enabled      = ColI32(st.get(), 4) != 0;
    r.low_threshold_c  = ColDouble(st.get(), 5);
    r.cooldown_minutes = static_cast<uint32_t>(ColU64(st.get(), 6));
    r.recipient        = ColText(st.get(), 7);
    return r;
}

Result SqliteRepository::UpsertAlertSettings(Transaction& t, const model::AlertSettingsRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO alert_settings(serial,alerts_enabled,high_enabled,high_threshold_c,low_enabled,low_threshold_c,"
                       "cooldown_minutes,recipient) VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(serial) DO UPDATE SET "
                       "alerts_enabled=excluded.alerts_enabled,high_enabled=excluded.high_enabled,high_threshold_c=excluded.high_threshold_c,"
                       "low_enabled=excluded.low_enabled,low_threshold_c=excluded.low_threshold_c,cooldown_minutes=excluded.cooldown_minutes,"
                       "recipient=excluded.recipient;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.serial);
    BindI32(st.get(), 2, r.alerts_enabled ? 1 : 0);
    BindI32(st.get(), 3, r.high_enabled ? 1 : 0);
    BindDouble(st.get(), 4, r.high_threshold_c);
    BindI32(st.get(), 5, r.low_enabled ? 1 : 0);
    BindDouble(st.get(), 6, r.low_threshold_c);
    BindU64(st.get(), 7, r.cooldown_minutes);
    BindText(st.get(), 8, r.recipient);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertAlertState(Transaction& t, const model::AlertStateRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
                       "INSERT INTO alert_states(serial,direction,last_fired_ms) VALUES(?,?,?) "
                       "ON CONFLICT(serial,direction) DO UPDATE SET last_fired_ms=excluded.last_fired_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.serial);
    BindI32(st.get(), 2, static_cast<int>(r.direction));
    BindU64(st.get(), 3, r.last_fired_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::AlertStateRecord> SqliteRepository::ListAlertStates(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, "SELECT serial,direction,last_fired_ms FROM alert_states ORDER BY serial,direction;");

    std::vector<model::AlertStateRecord> out;
    while (StepRow(db, st.get())) {
        model::AlertStateRecord r;
        r.serial        = ColText(st.get(), 0);
        r.direction     = static_cast<telemetry::gate::core::v1::AlertDirection>(ColI32(st.get(), 1));
        r.last_fired_ms = ColU64(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace telemetry::db::sqlite
