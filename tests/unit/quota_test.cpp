#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/quota/plan_ceilings.hpp"
#include "internal/quota/quota_enforcer.hpp"
#include "internal/quota/usage_recomputer.hpp"
#include "internal/store/telemetry_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using telemetry::db::model::StorageProfileRecord;
using telemetry::gate::core::v1::STORAGE_PLAN_FREE;
using telemetry::gate::core::v1::STORAGE_PLAN_PREMIUM;
using telemetry::gate::core::v1::STORAGE_PLAN_STANDARD;
using telemetry::quota::PlanCeilings;
using telemetry::quota::QuotaEnforcer;
using telemetry::quota::UsageRecomputer;

std::shared_ptr<telemetry::db::memory::MemoryRepository> SeededRepository() {
  auto repo = std::make_shared<telemetry::db::memory::MemoryRepository>();
  auto tx   = repo->Begin();
  assert(repo->UpsertAccount(*tx, {"owner-1", "owner@example.com"}));
  assert(repo->UpsertAccount(*tx, {"owner-2", "other@example.com"}));

  telemetry::db::model::DeviceRecord device;
  device.owner_id = "owner-1";
  device.serial   = "TH-001";
  assert(repo->InsertDevice(*tx, device));
  device.serial = "TH-002";
  assert(repo->InsertDevice(*tx, device));
  device.owner_id = "owner-2";
  device.serial   = "TH-900";
  assert(repo->InsertDevice(*tx, device));
  tx->Commit();
  return repo;
}

void PutProfile(telemetry::db::Repository& repo, const StorageProfileRecord& profile) {
  auto tx = repo.Begin();
  assert(repo.UpsertStorageProfile(*tx, profile));
  tx->Commit();
}

StorageProfileRecord GetProfile(telemetry::db::Repository& repo, const std::string& owner) {
  auto tx      = repo.Begin();
  auto profile = repo.GetStorageProfile(*tx, owner);
  tx->Commit();
  assert(profile);
  return *profile;
}

bool IsRejected(const QuotaEnforcer& enforcer, const std::string& owner) {
  try {
    enforcer.Check(owner);
  } catch (const telemetry::util::QuotaExceeded&) {
    return true;
  }
  return false;
}

namespace model = telemetry::db::model;

// Forwards to a memory repository. The first usage read inside a recompute
// stores a plan change in the same transaction, the way a SetStoragePlan
// committed between the recompute's read and its write would appear.
class PlanChangeDuringRecompute final : public telemetry::db::Repository {
 public:
  using Transaction = telemetry::db::Transaction;
  using Result      = telemetry::db::Result;

  explicit PlanChangeDuringRecompute(std::shared_ptr<telemetry::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }
  Result UpsertAccount(Transaction& t, const model::AccountRecord& r) override {
    return inner_->UpsertAccount(t, r);
  }
  std::optional<model::AccountRecord> GetAccount(Transaction& t, const std::string& id) override {
    return inner_->GetAccount(t, id);
  }
  Result InsertDevice(Transaction& t, const model::DeviceRecord& r) override {
    return inner_->InsertDevice(t, r);
  }
  std::optional<model::DeviceRecord> GetDevice(Transaction& t, const std::string& serial) override {
    return inner_->GetDevice(t, serial);
  }
  Result RenameDevice(Transaction& t, const std::string& serial, const std::string& name) override {
    return inner_->RenameDevice(t, serial, name);
  }
  Result TouchDevice(Transaction& t, const std::string& serial, uint64_t seen_ms, const std::string& ip) override {
    return inner_->TouchDevice(t, serial, seen_ms, ip);
  }
  Result InsertCredential(Transaction& t, model::CredentialRecord& r) override {
    return inner_->InsertCredential(t, r);
  }
  std::optional<model::CredentialRecord> GetActiveCredential(Transaction& t, const std::string& serial) override {
    return inner_->GetActiveCredential(t, serial);
  }
  std::optional<model::ActiveCredential> GetActiveCredentialWithDevice(Transaction& t, const std::string& serial) override {
    return inner_->GetActiveCredentialWithDevice(t, serial);
  }
  std::vector<model::CredentialRecord> ListCredentials(Transaction& t, const std::string& serial) override {
    return inner_->ListCredentials(t, serial);
  }
  Result DeactivateCredentials(Transaction& t, const std::string& serial, uint64_t& deactivated) override {
    return inner_->DeactivateCredentials(t, serial, deactivated);
  }
  Result AppendSample(Transaction& t, model::SampleRecord& r) override {
    return inner_->AppendSample(t, r);
  }
  std::vector<model::SampleRecord> ReadSamplesRange(Transaction& t, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                    uint32_t limit) override {
    return inner_->ReadSamplesRange(t, serial, start_ms, end_ms, limit);
  }
  std::vector<model::SampleRecord> ReadRecentSamples(Transaction& t, const std::string& serial, uint32_t limit) override {
    return inner_->ReadRecentSamples(t, serial, limit);
  }
  model::OwnerUsageStats GetOwnerUsageStats(Transaction& t, const std::string& owner_id, uint32_t average_window) override {
    if (!changed_) {
      changed_     = true;
      auto profile = inner_->GetStorageProfile(t, owner_id);
      assert(profile);
      profile->plan = STORAGE_PLAN_PREMIUM;
      assert(inner_->UpsertStorageProfile(t, *profile));
    }
    return inner_->GetOwnerUsageStats(t, owner_id, average_window);
  }
  std::optional<model::StorageProfileRecord> GetStorageProfile(Transaction& t, const std::string& owner_id) override {
    return inner_->GetStorageProfile(t, owner_id);
  }
  std::vector<model::StorageProfileRecord> ListStorageProfiles(Transaction& t) override {
    return inner_->ListStorageProfiles(t);
  }
  Result UpsertStorageProfile(Transaction& t, const model::StorageProfileRecord& r) override {
    return inner_->UpsertStorageProfile(t, r);
  }
  Result AddStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes) override {
    return inner_->AddStorageUsage(t, owner_id, bytes);
  }
  Result SetStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) override {
    return inner_->SetStorageUsage(t, owner_id, bytes, recomputed_at_ms);
  }
  Result SetStoragePlan(Transaction& t, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) override {
    return inner_->SetStoragePlan(t, owner_id, plan);
  }
  std::optional<model::AlertSettingsRecord> GetAlertSettings(Transaction& t, const std::string& serial) override {
    return inner_->GetAlertSettings(t, serial);
  }
  Result UpsertAlertSettings(Transaction& t, const model::AlertSettingsRecord& r) override {
    return inner_->UpsertAlertSettings(t, r);
  }
  Result UpsertAlertState(Transaction& t, const model::AlertStateRecord& r) override {
    return inner_->UpsertAlertState(t, r);
  }
  std::vector<model::AlertStateRecord> ListAlertStates(Transaction& t) override {
    return inner_->ListAlertStates(t);
  }

 private:
  std::shared_ptr<telemetry::db::Repository> inner_;
  bool                                       changed_ = false;
};

telemetry::db::model::SampleRecord Sample(const std::string& serial, std::size_t raw_size) {
  telemetry::db::model::SampleRecord s;
  s.serial        = serial;
  s.mode          = telemetry::gate::core::v1::MODE_HEAT;
  s.output        = telemetry::gate::core::v1::OUTPUT_HEAT_ON;
  s.setpoint_c    = 21.0;
  s.temp_inside_c = 20.0;
  s.raw_payload.assign(raw_size, 'x');
  return s;
}

void TestCeilingsPerPlan() {
  PlanCeilings ceilings;
  assert(ceilings.For(STORAGE_PLAN_FREE) == 2ull * telemetry::quota::kGiB);
  assert(ceilings.For(STORAGE_PLAN_STANDARD) == 10ull * telemetry::quota::kGiB);
  assert(ceilings.For(STORAGE_PLAN_PREMIUM) == 1024ull * telemetry::quota::kGiB);
  assert(ceilings.For(telemetry::gate::core::v1::STORAGE_PLAN_UNSPECIFIED) == ceilings.free_bytes);
}

void TestEnforcerBlocksAtCeiling() {
  auto          repo = SeededRepository();
  PlanCeilings  ceilings{1000, 5000, 10000};
  QuotaEnforcer enforcer(repo, ceilings);

  PutProfile(*repo, {"owner-1", STORAGE_PLAN_FREE, 999, 0});
  assert(!IsRejected(enforcer, "owner-1"));

  PutProfile(*repo, {"owner-1", STORAGE_PLAN_FREE, 1000, 0});
  assert(IsRejected(enforcer, "owner-1"));

  // upgrading lifts the block without touching usage
  PutProfile(*repo, {"owner-1", STORAGE_PLAN_STANDARD, 1000, 0});
  assert(!IsRejected(enforcer, "owner-1"));
}

void TestMissingProfileIsTreatedAsEmptyFreePlan() {
  auto          repo = SeededRepository();
  QuotaEnforcer enforcer(repo, PlanCeilings{});
  assert(!IsRejected(enforcer, "owner-2"));
  assert(!IsRejected(enforcer, "nobody"));
}

void TestRecomputeFormula() {
  telemetry::db::model::OwnerUsageStats stats;
  assert(UsageRecomputer::Estimate(stats) == 0);

  stats.sample_count          = 10;
  stats.average_payload_bytes = 150.0;
  assert(UsageRecomputer::Estimate(stats) == 10 * (200 + 150 + 100));

  stats.sample_count          = 3;
  stats.average_payload_bytes = 100.5;
  assert(UsageRecomputer::Estimate(stats) == 1202);  // 3 * 400.5 rounded
}

void TestRecomputeReplacesCachedUsage() {
  auto repo  = SeededRepository();
  auto clock = std::make_shared<telemetry::util::ManualClock>();

  telemetry::store::TelemetryStore store(repo, clock);
  (void)store.Append(Sample("TH-001", 100), "owner-1", "");
  (void)store.Append(Sample("TH-002", 300), "owner-1", "");
  (void)store.Append(Sample("TH-900", 50), "owner-2", "");

  // incremental charge is 300 + raw length per write
  assert(GetProfile(*repo, "owner-1").usage_bytes == 400 + 600);

  UsageRecomputer recomputer(repo, clock);
  const auto      profile = recomputer.RecomputeOwner("owner-1");
  assert(profile.usage_bytes == 2 * (200 + 200 + 100));
  assert(profile.usage_recomputed_at_ms == telemetry::util::ToUnixMillis(clock->Now()));
  assert(GetProfile(*repo, "owner-1").usage_bytes == profile.usage_bytes);

  // other owners untouched
  assert(GetProfile(*repo, "owner-2").usage_bytes == 350);
}

void TestRecomputeKeepsConcurrentPlanChange() {
  auto repo  = SeededRepository();
  auto clock = std::make_shared<telemetry::util::ManualClock>();

  telemetry::store::TelemetryStore store(repo, clock);
  (void)store.Append(Sample("TH-001", 100), "owner-1", "");
  assert(GetProfile(*repo, "owner-1").plan == STORAGE_PLAN_FREE);

  UsageRecomputer recomputer(std::make_shared<PlanChangeDuringRecompute>(repo), clock);
  const auto      profile = recomputer.RecomputeOwner("owner-1");
  assert(profile.usage_bytes == 200 + 100 + 100);
  assert(profile.plan == STORAGE_PLAN_PREMIUM);

  const auto stored = GetProfile(*repo, "owner-1");
  assert(stored.plan == STORAGE_PLAN_PREMIUM);
  assert(stored.usage_bytes == profile.usage_bytes);
  assert(stored.usage_recomputed_at_ms == telemetry::util::ToUnixMillis(clock->Now()));

  // an owner with no profile yet gets a FREE one
  telemetry::quota::UsageRecomputer direct(repo, clock);
  auto tx = repo->Begin();
  assert(repo->UpsertAccount(*tx, {"owner-3", "third@example.com"}));
  tx->Commit();
  const auto fresh = direct.RecomputeOwner("owner-3");
  assert(fresh.plan == STORAGE_PLAN_FREE);
  assert(fresh.usage_bytes == 0);
}

void TestRecomputeAverageUsesNewestHundred() {
  auto repo  = SeededRepository();
  auto clock = std::make_shared<telemetry::util::ManualClock>();

  telemetry::store::TelemetryStore store(repo, clock);
  for (int i = 0; i < 50; ++i) {
    (void)store.Append(Sample("TH-001", 1000), "owner-1", "");
    clock->Advance(std::chrono::milliseconds(1));
  }
  for (int i = 0; i < 100; ++i) {
    (void)store.Append(Sample("TH-001", 10), "owner-1", "");
    clock->Advance(std::chrono::milliseconds(1));
  }

  UsageRecomputer recomputer(repo, clock);
  assert(recomputer.RecomputeOwner("owner-1").usage_bytes == 150 * (200 + 10 + 100));
}

void TestRecomputeStaleSkipsFreshProfiles() {
  auto repo  = SeededRepository();
  auto clock = std::make_shared<telemetry::util::ManualClock>();
  const auto now_ms = telemetry::util::ToUnixMillis(clock->Now());

  PutProfile(*repo, {"owner-1", STORAGE_PLAN_FREE, 123, now_ms - 1000});
  PutProfile(*repo, {"owner-2", STORAGE_PLAN_FREE, 456, 0});

  UsageRecomputer recomputer(repo, clock);
  auto            refreshed = recomputer.RecomputeStale(std::chrono::hours(1));
  assert(refreshed.size() == 1);
  assert(refreshed[0].owner_id == "owner-2");
  assert(refreshed[0].usage_bytes == 0);
  assert(GetProfile(*repo, "owner-1").usage_bytes == 123);

  clock->Advance(std::chrono::hours(2));
  refreshed = recomputer.RecomputeStale(std::chrono::hours(1));
  assert(refreshed.size() == 2);
  assert(GetProfile(*repo, "owner-1").usage_bytes == 0);

  assert(recomputer.RecomputeAll().size() == 2);
}

void TestRecomputeCanUnblockOwner() {
  auto          repo  = SeededRepository();
  auto          clock = std::make_shared<telemetry::util::ManualClock>();
  QuotaEnforcer enforcer(repo, PlanCeilings{1000, 5000, 10000});

  PutProfile(*repo, {"owner-1", STORAGE_PLAN_FREE, 5000, 0});
  assert(IsRejected(enforcer, "owner-1"));

  UsageRecomputer recomputer(repo, clock);
  (void)recomputer.RecomputeOwner("owner-1");
  assert(!IsRejected(enforcer, "owner-1"));
  assert(GetProfile(*repo, "owner-1").plan == STORAGE_PLAN_FREE);
}

} // namespace

int main() {
  TestCeilingsPerPlan();
  TestEnforcerBlocksAtCeiling();
  TestMissingProfileIsTreatedAsEmptyFreePlan();
  TestRecomputeFormula();
  TestRecomputeReplacesCachedUsage();
  TestRecomputeKeepsConcurrentPlanChange();
  TestRecomputeAverageUsesNewestHundred();
  TestRecomputeStaleSkipsFreshProfiles();
  TestRecomputeCanUnblockOwner();

  std::cout << "telemetry_unit_quota: pass\n";
  return 0;
}
