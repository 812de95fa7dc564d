#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if TELEMETRY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TELEMETRY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using telemetry::db::ErrorCode;
using telemetry::db::Repository;
using telemetry::db::memory::MemoryRepository;
using telemetry::db::model::AccountRecord;
using telemetry::db::model::AlertSettingsRecord;
using telemetry::db::model::AlertStateRecord;
using telemetry::db::model::CredentialRecord;
using telemetry::db::model::DeviceRecord;
using telemetry::db::model::SampleRecord;
using telemetry::db::model::StorageProfileRecord;
using telemetry::gate::core::v1::ALERT_DIRECTION_HIGH;
using telemetry::gate::core::v1::ALERT_DIRECTION_LOW;
using telemetry::gate::core::v1::MODE_HEAT;
using telemetry::gate::core::v1::OUTPUT_HEAT_ON;
using telemetry::gate::core::v1::STORAGE_PLAN_FREE;
using telemetry::gate::core::v1::STORAGE_PLAN_PREMIUM;
using telemetry::gate::core::v1::STORAGE_PLAN_STANDARD;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SampleRecord MakeSample(const std::string& serial, uint64_t received_at_ms, std::string raw) {
  SampleRecord s;
  s.serial         = serial;
  s.mode           = MODE_HEAT;
  s.setpoint_c     = 21.5;
  s.temp_inside_c  = 20.25;
  s.hysteresis_c   = 0.5;
  s.output         = OUTPUT_HEAT_ON;
  s.received_at_ms = received_at_ms;
  s.raw_payload    = std::move(raw);
  return s;
}

// Every serial is prefixed by the backend name so runs against a shared
// postgres database do not collide.
void SeedDevice(Repository& repo, const std::string& owner, const std::string& serial) {
  auto tx = repo.Begin();
  assert(repo.UpsertAccount(*tx, AccountRecord{.id = owner, .email = owner + "@example.com"}));
  assert(repo.InsertDevice(*tx, DeviceRecord{.serial = serial, .owner_id = owner, .name = "Hallway", .created_at_ms = NowMs()}));
  tx->Commit();
}

void VerifyDevices(Repository& repo, const std::string& prefix) {
  const auto owner  = prefix + "-owner-devices";
  const auto serial = prefix + "-DEV-1";
  SeedDevice(repo, owner, serial);

  auto tx = repo.Begin();

  auto account = repo.GetAccount(*tx, owner);
  assert(account.has_value());
  assert(account->email == owner + "@example.com");

  auto duplicate = repo.InsertDevice(*tx, DeviceRecord{.serial = serial, .owner_id = owner, .created_at_ms = NowMs()});
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  assert(repo.RenameDevice(*tx, serial, "Kitchen"));
  assert(repo.RenameDevice(*tx, prefix + "-missing", "x").code == ErrorCode::NotFound);

  assert(repo.TouchDevice(*tx, serial, 1000, "10.0.0.7"));
  assert(repo.TouchDevice(*tx, serial, 2000, ""));

  auto device = repo.GetDevice(*tx, serial);
  assert(device.has_value());
  assert(device->owner_id == owner);
  assert(device->name == "Kitchen");
  assert(device->last_seen_ms == 2000);
  assert(device->last_ip == "10.0.0.7");

  assert(!repo.GetDevice(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyCredentials(Repository& repo, const std::string& prefix) {
  const auto serial = prefix + "-DEV-CRED";
  SeedDevice(repo, prefix + "-owner-cred", serial);

  auto tx = repo.Begin();

  CredentialRecord first{.serial = serial, .salt_hex = "00", .hash_hex = "aa", .created_at_ms = 1, .expires_at_ms = 0, .active = true};
  assert(repo.InsertCredential(*tx, first));
  assert(first.id != 0);

  uint64_t deactivated = 0;
  assert(repo.DeactivateCredentials(*tx, serial, deactivated));
  assert(deactivated == 1);

  CredentialRecord second{.serial = serial, .salt_hex = "01", .hash_hex = "bb", .created_at_ms = 2, .expires_at_ms = 99, .active = true};
  assert(repo.InsertCredential(*tx, second));
  assert(second.id > first.id);

  auto active = repo.GetActiveCredential(*tx, serial);
  assert(active.has_value());
  assert(active->id == second.id);
  assert(active->hash_hex == "bb");
  assert(active->expires_at_ms == 99);

  auto joined = repo.GetActiveCredentialWithDevice(*tx, serial);
  assert(joined.has_value());
  assert(joined->credential.id == second.id);
  assert(joined->credential.salt_hex == "01");
  assert(joined->device.serial == serial);
  assert(joined->device.owner_id == prefix + "-owner-cred");
  assert(joined->device.name == "Hallway");
  assert(!repo.GetActiveCredentialWithDevice(*tx, prefix + "-unknown").has_value());

  auto all = repo.ListCredentials(*tx, serial);
  assert(all.size() == 2);
  assert(all[0].id == first.id && !all[0].active);
  assert(all[1].id == second.id && all[1].active);

  CredentialRecord orphan{.serial = prefix + "-missing", .salt_hex = "02", .hash_hex = "cc", .created_at_ms = 3, .active = true};
  assert(repo.InsertCredential(*tx, orphan).code == ErrorCode::ConstraintViolation);

  tx->Commit();

  auto revoke_tx = repo.Begin();
  deactivated    = 0;
  assert(repo.DeactivateCredentials(*revoke_tx, serial, deactivated));
  assert(deactivated == 1);
  deactivated = 0;
  assert(repo.DeactivateCredentials(*revoke_tx, serial, deactivated));
  assert(deactivated == 0);
  assert(!repo.GetActiveCredential(*revoke_tx, serial).has_value());
  assert(!repo.GetActiveCredentialWithDevice(*revoke_tx, serial).has_value());
  revoke_tx->Commit();
}

void VerifySamples(Repository& repo, const std::string& prefix) {
  const auto owner  = prefix + "-owner-samples";
  const auto serial = prefix + "-DEV-SAMPLES";
  SeedDevice(repo, owner, serial);

  auto tx = repo.Begin();

  auto full          = MakeSample(serial, 1000, R"({"a":1})");
  full.temp_outside_c   = -4.5;
  full.humidity_percent = 55.0;
  full.device_ts_ms     = 999;
  assert(repo.AppendSample(*tx, full));

  // same received_at as the first; id breaks the tie
  auto tie = MakeSample(serial, 1000, "xx");
  assert(repo.AppendSample(*tx, tie));
  assert(tie.id > full.id);

  auto later = MakeSample(serial, 2000, "yyyy");
  assert(repo.AppendSample(*tx, later));

  auto orphan = MakeSample(prefix + "-missing", 1500, "z");
  assert(repo.AppendSample(*tx, orphan).code == ErrorCode::ConstraintViolation);

  tx->Commit();

  auto read_tx = repo.Begin();

  auto range = repo.ReadSamplesRange(*read_tx, serial, 1000, 2000, 100);
  assert(range.size() == 2);
  assert(range[0].id == full.id);
  assert(range[1].id == tie.id);
  assert(range[0].temp_outside_c.has_value() && *range[0].temp_outside_c == -4.5);
  assert(range[0].humidity_percent.has_value() && *range[0].humidity_percent == 55.0);
  assert(range[0].device_ts_ms == 999);
  assert(range[0].mode == MODE_HEAT);
  assert(range[0].output == OUTPUT_HEAT_ON);
  assert(range[0].raw_payload == R"({"a":1})");
  assert(!range[1].temp_outside_c.has_value());
  assert(!range[1].humidity_percent.has_value());

  assert(repo.ReadSamplesRange(*read_tx, serial, 0, 5000, 1).size() == 1);
  assert(repo.ReadSamplesRange(*read_tx, serial, 2001, 5000, 100).empty());

  auto recent = repo.ReadRecentSamples(*read_tx, serial, 2);
  assert(recent.size() == 2);
  assert(recent[0].id == later.id);
  assert(recent[1].id == tie.id);

  auto stats = repo.GetOwnerUsageStats(*read_tx, owner, 2);
  assert(stats.sample_count == 3);
  assert(stats.average_payload_bytes == 3.0);

  auto empty = repo.GetOwnerUsageStats(*read_tx, prefix + "-nobody", 100);
  assert(empty.sample_count == 0);
  assert(empty.average_payload_bytes == 0.0);

  read_tx->Commit();
}

void VerifyStorageProfiles(Repository& repo, const std::string& prefix) {
  const auto owner = prefix + "-owner-profile";

  auto tx = repo.Begin();
  assert(!repo.GetStorageProfile(*tx, owner).has_value());

  assert(repo.AddStorageUsage(*tx, owner, 300));
  auto created = repo.GetStorageProfile(*tx, owner);
  assert(created.has_value());
  assert(created->plan == STORAGE_PLAN_FREE);
  assert(created->usage_bytes == 300);

  assert(repo.AddStorageUsage(*tx, owner, 120));
  assert(repo.GetStorageProfile(*tx, owner)->usage_bytes == 420);

  assert(repo.UpsertStorageProfile(
      *tx, StorageProfileRecord{.owner_id = owner, .plan = STORAGE_PLAN_PREMIUM, .usage_bytes = 7, .usage_recomputed_at_ms = 55}));
  auto updated = repo.GetStorageProfile(*tx, owner);
  assert(updated->plan == STORAGE_PLAN_PREMIUM);
  assert(updated->usage_bytes == 7);
  assert(updated->usage_recomputed_at_ms == 55);

  // usage rewrite keeps the plan
  assert(repo.SetStorageUsage(*tx, owner, 900, 77));
  updated = repo.GetStorageProfile(*tx, owner);
  assert(updated->plan == STORAGE_PLAN_PREMIUM);
  assert(updated->usage_bytes == 900);
  assert(updated->usage_recomputed_at_ms == 77);

  const auto fresh_owner = prefix + "-owner-profile-fresh";
  assert(repo.SetStorageUsage(*tx, fresh_owner, 12, 34));
  auto fresh = repo.GetStorageProfile(*tx, fresh_owner);
  assert(fresh.has_value());
  assert(fresh->plan == STORAGE_PLAN_FREE);
  assert(fresh->usage_bytes == 12);
  assert(fresh->usage_recomputed_at_ms == 34);

  // plan change keeps usage
  assert(repo.SetStoragePlan(*tx, fresh_owner, STORAGE_PLAN_STANDARD));
  fresh = repo.GetStorageProfile(*tx, fresh_owner);
  assert(fresh->plan == STORAGE_PLAN_STANDARD);
  assert(fresh->usage_bytes == 12);
  assert(fresh->usage_recomputed_at_ms == 34);

  const auto plan_only = prefix + "-owner-profile-plan";
  assert(repo.SetStoragePlan(*tx, plan_only, STORAGE_PLAN_PREMIUM));
  auto created_by_plan = repo.GetStorageProfile(*tx, plan_only);
  assert(created_by_plan.has_value());
  assert(created_by_plan->plan == STORAGE_PLAN_PREMIUM);
  assert(created_by_plan->usage_bytes == 0);

  bool listed = false;
  for (const auto& p : repo.ListStorageProfiles(*tx)) {
    if (p.owner_id == owner) listed = true;
  }
  assert(listed);
  tx->Commit();
}

void VerifyAlerts(Repository& repo, const std::string& prefix) {
  const auto serial = prefix + "-DEV-ALERTS";
  SeedDevice(repo, prefix + "-owner-alerts", serial);

  auto tx = repo.Begin();
  assert(!repo.GetAlertSettings(*tx, serial).has_value());

  AlertSettingsRecord settings{.serial           = serial,
                               .alerts_enabled   = true,
                               .high_enabled     = false,
                               .high_threshold_c = 28.5,
                               .low_enabled      = true,
                               .low_threshold_c  = 12.0,
                               .cooldown_minutes = 15,
                               .recipient        = "ops@example.com"};
  assert(repo.UpsertAlertSettings(*tx, settings));

  settings.cooldown_minutes = 20;
  assert(repo.UpsertAlertSettings(*tx, settings));

  auto stored = repo.GetAlertSettings(*tx, serial);
  assert(stored.has_value());
  assert(!stored->high_enabled);
  assert(stored->high_threshold_c == 28.5);
  assert(stored->low_threshold_c == 12.0);
  assert(stored->cooldown_minutes == 20);
  assert(stored->recipient == "ops@example.com");

  settings.serial = prefix + "-missing";
  assert(repo.UpsertAlertSettings(*tx, settings).code == ErrorCode::ConstraintViolation);

  assert(repo.UpsertAlertState(*tx, AlertStateRecord{.serial = serial, .direction = ALERT_DIRECTION_HIGH, .last_fired_ms = 10}));
  assert(repo.UpsertAlertState(*tx, AlertStateRecord{.serial = serial, .direction = ALERT_DIRECTION_HIGH, .last_fired_ms = 20}));
  assert(repo.UpsertAlertState(*tx, AlertStateRecord{.serial = serial, .direction = ALERT_DIRECTION_LOW, .last_fired_ms = 30}));
  tx->Commit();

  auto read_tx = repo.Begin();
  int  found   = 0;
  for (const auto& state : repo.ListAlertStates(*read_tx)) {
    if (state.serial != serial) continue;
    ++found;
    if (state.direction == ALERT_DIRECTION_HIGH) assert(state.last_fired_ms == 20);
    if (state.direction == ALERT_DIRECTION_LOW) assert(state.last_fired_ms == 30);
  }
  assert(found == 2);
  read_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto serial = prefix + "-DEV-ROLLBACK";
  SeedDevice(repo, prefix + "-owner-rollback", serial);

  {
    auto tx = repo.Begin();
    auto s  = MakeSample(serial, 5000, "rolled back");
    assert(repo.AppendSample(*tx, s));
    assert(repo.AddStorageUsage(*tx, prefix + "-owner-rollback", 1000));
    assert(repo.RenameDevice(*tx, serial, "Renamed"));
    tx->Rollback();
  }

  {
    // destructor rolls back an uncommitted transaction
    auto tx = repo.Begin();
    auto s  = MakeSample(serial, 6000, "dropped");
    assert(repo.AppendSample(*tx, s));
  }

  auto tx = repo.Begin();
  assert(repo.ReadRecentSamples(*tx, serial, 10).empty());
  assert(!repo.GetStorageProfile(*tx, prefix + "-owner-rollback").has_value());
  assert(repo.GetDevice(*tx, serial)->name == "Hallway");
  tx->Commit();
}

void VerifyConcurrentAppends(Repository& repo, const std::string& prefix) {
  const auto serial = prefix + "-DEV-CONCURRENT";
  SeedDevice(repo, prefix + "-owner-concurrent", serial);

  constexpr int kThreads   = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&repo, &serial, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        auto tx = repo.Begin();
        auto s  = MakeSample(serial, 10000 + static_cast<uint64_t>(t * kPerThread + i), "c");
        assert(repo.AppendSample(*tx, s));
        assert(repo.AddStorageUsage(*tx, serial + "-usage", 1));
        tx->Commit();
      }
    });
  }
  for (auto& w : workers) w.join();

  auto tx      = repo.Begin();
  auto samples = repo.ReadSamplesRange(*tx, serial, 0, 20000, 1000);
  assert(samples.size() == kThreads * kPerThread);
  assert(repo.GetStorageProfile(*tx, serial + "-usage")->usage_bytes == kThreads * kPerThread);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto owner  = prefix + "-owner-durable";
  const auto serial = prefix + "-DEV-DURABLE";

  auto repo = backend.make_repository();
  SeedDevice(*repo, owner, serial);
  {
    auto tx = repo->Begin();
    auto s  = MakeSample(serial, 7000, "durable");
    assert(repo->AppendSample(*tx, s));
    assert(repo->AddStorageUsage(*tx, owner, 307));
    assert(repo->UpsertAlertState(*tx, AlertStateRecord{.serial = serial, .direction = ALERT_DIRECTION_HIGH, .last_fired_ms = 7000}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetDevice(*tx, serial).has_value());

  auto recent = repo->ReadRecentSamples(*tx, serial, 10);
  assert(recent.size() == 1);
  assert(recent[0].raw_payload == "durable");

  assert(repo->GetStorageProfile(*tx, owner)->usage_bytes == 307);

  bool state_found = false;
  for (const auto& state : repo->ListAlertStates(*tx)) {
    if (state.serial == serial && state.direction == ALERT_DIRECTION_HIGH && state.last_fired_ms == 7000) state_found = true;
  }
  assert(state_found);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TELEMETRY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("telemetry_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<telemetry::db::sqlite::SqliteDB>(db_path);
    telemetry::db::sql::RunMigrations(*db, telemetry::db::sql::SqliteSchema());
    return std::make_shared<telemetry::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if TELEMETRY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TELEMETRY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TELEMETRY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<telemetry::db::postgres::PgPool>(conninfo);
    telemetry::db::postgres::PgMigrationExecutor executor(pool);
    telemetry::db::sql::RunMigrations(executor, telemetry::db::sql::PostgresSchema());
    return std::make_shared<telemetry::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyDevices(*repo, prefix);
  VerifyCredentials(*repo, prefix);
  VerifySamples(*repo, prefix);
  VerifyStorageProfiles(*repo, prefix);
  VerifyAlerts(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyConcurrentAppends(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TELEMETRY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TELEMETRY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "telemetry_integration_repository_parity: pass\n";
  return 0;
}
