#include "migrations.hpp"

#include "internal/util/time.hpp"

namespace telemetry::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }

  executor.ExecuteSQL("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(ordered_sql.size()) + ", " +
                      std::to_string(util::ToUnixMillis(util::Now())) + ") ON CONFLICT(version) DO NOTHING;");
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS accounts (id TEXT PRIMARY KEY, email TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS devices (serial TEXT PRIMARY KEY, owner_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, "
      "last_seen_ms INTEGER NOT NULL DEFAULT 0, last_ip TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS devices_owner ON devices(owner_id);",
      "CREATE TABLE IF NOT EXISTS device_credentials (id INTEGER PRIMARY KEY AUTOINCREMENT, serial TEXT NOT NULL REFERENCES devices(serial), salt_hex "
      "TEXT NOT NULL, hash_hex TEXT NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL DEFAULT 0, active INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS device_credentials_one_active ON device_credentials(serial) WHERE active = 1;",
      "CREATE TABLE IF NOT EXISTS telemetry_samples (id INTEGER PRIMARY KEY AUTOINCREMENT, serial TEXT NOT NULL REFERENCES devices(serial), mode "
      "INTEGER NOT NULL, setpoint_c REAL NOT NULL, temp_inside_c REAL NOT NULL, temp_outside_c REAL, humidity_percent REAL, hysteresis_c REAL NOT "
      "NULL, output INTEGER NOT NULL, device_ts_ms INTEGER NOT NULL DEFAULT 0, received_at_ms INTEGER NOT NULL, raw_payload TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS telemetry_samples_serial_received ON telemetry_samples(serial, received_at_ms, id);",
      "CREATE TABLE IF NOT EXISTS storage_profiles (owner_id TEXT PRIMARY KEY, plan INTEGER NOT NULL, usage_bytes INTEGER NOT NULL DEFAULT 0, "
      "usage_recomputed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS alert_settings (serial TEXT PRIMARY KEY REFERENCES devices(serial), alerts_enabled INTEGER NOT NULL, high_enabled "
      "INTEGER NOT NULL, high_threshold_c REAL NOT NULL, low_enabled INTEGER NOT NULL, low_threshold_c REAL NOT NULL, cooldown_minutes INTEGER NOT "
      "NULL, recipient TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS alert_states (serial TEXT NOT NULL, direction INTEGER NOT NULL, last_fired_ms INTEGER NOT NULL, PRIMARY KEY (serial, "
      "direction));"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS accounts (id TEXT PRIMARY KEY, email TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS devices (serial VARCHAR(64) PRIMARY KEY, owner_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '', created_at_ms BIGINT "
      "NOT NULL, last_seen_ms BIGINT NOT NULL DEFAULT 0, last_ip TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS devices_owner ON devices(owner_id);",
      "CREATE TABLE IF NOT EXISTS device_credentials (id BIGSERIAL PRIMARY KEY, serial VARCHAR(64) NOT NULL REFERENCES devices(serial), salt_hex TEXT "
      "NOT NULL, hash_hex TEXT NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL DEFAULT 0, active BOOLEAN NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS device_credentials_one_active ON device_credentials(serial) WHERE active;",
      "CREATE TABLE IF NOT EXISTS telemetry_samples (id BIGSERIAL PRIMARY KEY, serial VARCHAR(64) NOT NULL REFERENCES devices(serial), mode SMALLINT "
      "NOT NULL, setpoint_c DOUBLE PRECISION NOT NULL, temp_inside_c DOUBLE PRECISION NOT NULL, temp_outside_c DOUBLE PRECISION, humidity_percent "
      "DOUBLE PRECISION, hysteresis_c DOUBLE PRECISION NOT NULL, output SMALLINT NOT NULL, device_ts_ms BIGINT NOT NULL DEFAULT 0, received_at_ms "
      "BIGINT NOT NULL, raw_payload TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS telemetry_samples_serial_received ON telemetry_samples(serial, received_at_ms, id);",
      "CREATE TABLE IF NOT EXISTS storage_profiles (owner_id TEXT PRIMARY KEY, plan SMALLINT NOT NULL, usage_bytes BIGINT NOT NULL DEFAULT 0, "
      "usage_recomputed_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS alert_settings (serial VARCHAR(64) PRIMARY KEY REFERENCES devices(serial), alerts_enabled BOOLEAN NOT NULL, "
      "high_enabled BOOLEAN NOT NULL, high_threshold_c DOUBLE PRECISION NOT NULL, low_enabled BOOLEAN NOT NULL, low_threshold_c DOUBLE PRECISION NOT "
      "NULL, cooldown_minutes INTEGER NOT NULL, recipient TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS alert_states (serial VARCHAR(64) NOT NULL, direction SMALLINT NOT NULL, last_fired_ms BIGINT NOT NULL, PRIMARY KEY "
      "(serial, direction));"};
  return kSchema;
}

} // namespace telemetry::db::sql
