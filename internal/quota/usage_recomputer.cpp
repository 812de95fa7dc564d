#include "usage_recomputer.hpp"

#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "plan_ceilings.hpp"

namespace telemetry::quota {

UsageRecomputer::UsageRecomputer(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

uint64_t UsageRecomputer::Estimate(const db::model::OwnerUsageStats& stats) {
  const double per_sample = static_cast<double>(kRecomputeRowBytes) + stats.average_payload_bytes + static_cast<double>(kRecomputeIndexBytes);
  return static_cast<uint64_t>(std::llround(static_cast<double>(stats.sample_count) * per_sample));
}

db::model::StorageProfileRecord UsageRecomputer::RecomputeOwner(const std::string& owner_id) {
  auto tx = repository_->Begin();

  // Only the usage columns are written so a plan change landing meanwhile survives.
  const auto stats = repository_->GetOwnerUsageStats(*tx, owner_id, kRecomputeAverageWindow);
  if (auto r = repository_->SetStorageUsage(*tx, owner_id, Estimate(stats), util::ToUnixMillis(clock_->Now())); !r) {
    throw util::StorageUnavailable("usage recompute failed: " + r.message);
  }
  auto profile = repository_->GetStorageProfile(*tx, owner_id);
  tx->Commit();
  if (!profile) throw util::StorageUnavailable("usage recompute failed: profile missing for " + owner_id);

  TELEMETRY_LOG_INFO("storage usage recomputed", {observability::StringField("owner", owner_id),
                                                  observability::IntField("samples", static_cast<int64_t>(stats.sample_count)),
                                                  observability::IntField("usage_bytes", static_cast<int64_t>(profile->usage_bytes))});
  return *profile;
}

std::vector<db::model::StorageProfileRecord> UsageRecomputer::RecomputeStale(std::chrono::milliseconds staleness) {
  std::vector<db::model::StorageProfileRecord> profiles;
  {
    auto tx  = repository_->Begin();
    profiles = repository_->ListStorageProfiles(*tx);
    tx->Commit();
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());
  const auto bound  = static_cast<uint64_t>(staleness.count());

  std::vector<db::model::StorageProfileRecord> refreshed;
  for (const auto& profile : profiles) {
    if (profile.usage_recomputed_at_ms != 0 && now_ms - profile.usage_recomputed_at_ms < bound) continue;
    refreshed.push_back(RecomputeOwner(profile.owner_id));
  }
  return refreshed;
}

std::vector<db::model::StorageProfileRecord> UsageRecomputer::RecomputeAll() {
  return RecomputeStale(std::chrono::milliseconds(0));
}

} // namespace telemetry::quota
