#include "pg_pool.hpp"

namespace telemetry::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_device",
               "SELECT serial, owner_id, name, created_at_ms, last_seen_ms, last_ip "
               "FROM devices WHERE serial=$1");

  conn.prepare("touch_device",
               "UPDATE devices SET last_seen_ms=$2, last_ip=CASE WHEN $3='' THEN last_ip ELSE $3 END "
               "WHERE serial=$1");

  conn.prepare("get_active_credential",
               "SELECT id, serial, salt_hex, hash_hex, created_at_ms, expires_at_ms, active "
               "FROM device_credentials WHERE serial=$1 AND active ORDER BY id DESC LIMIT 1");

  conn.prepare("get_active_credential_with_device",
               "SELECT c.id, c.serial, c.salt_hex, c.hash_hex, c.created_at_ms, c.expires_at_ms, c.active, "
               "d.owner_id, d.name, d.created_at_ms, d.last_seen_ms, d.last_ip "
               "FROM device_credentials c JOIN devices d ON d.serial=c.serial "
               "WHERE c.serial=$1 AND c.active ORDER BY c.id DESC LIMIT 1");

  conn.prepare("append_sample",
               "INSERT INTO telemetry_samples(serial,mode,setpoint_c,temp_inside_c,temp_outside_c,humidity_percent,"
               "hysteresis_c,output,device_ts_ms,received_at_ms,raw_payload) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) RETURNING id");

  conn.prepare("add_storage_usage",
               "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES($1,$2,$3,0) "
               "ON CONFLICT(owner_id) DO UPDATE SET usage_bytes=storage_profiles.usage_bytes+EXCLUDED.usage_bytes");

  conn.prepare("set_storage_usage",
               "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(owner_id) DO UPDATE SET usage_bytes=EXCLUDED.usage_bytes,"
               "usage_recomputed_at_ms=EXCLUDED.usage_recomputed_at_ms");

  conn.prepare("set_storage_plan",
               "INSERT INTO storage_profiles(owner_id,plan,usage_bytes,usage_recomputed_at_ms) VALUES($1,$2,0,0) "
               "ON CONFLICT(owner_id) DO UPDATE SET plan=EXCLUDED.plan");

  conn.prepare("get_storage_profile",
               "SELECT owner_id, plan, usage_bytes, usage_recomputed_at_ms FROM storage_profiles WHERE owner_id=$1");

  conn.prepare("get_alert_settings",
               "SELECT serial, alerts_enabled, high_enabled, high_threshold_c, low_enabled, low_threshold_c, "
               "cooldown_minutes, recipient FROM alert_settings WHERE serial=$1");

  conn.prepare("upsert_alert_state",
               "INSERT INTO alert_states(serial,direction,last_fired_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(serial,direction) DO UPDATE SET last_fired_ms=EXCLUDED.last_fired_ms");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  tx.exec(sql);
  tx.commit();
}

} // namespace telemetry::db::postgres
