#include "quota_enforcer.hpp"

#include "internal/util/errors.hpp"

namespace telemetry::quota {

QuotaEnforcer::QuotaEnforcer(std::shared_ptr<db::Repository> repository, PlanCeilings ceilings)
    : repository_(std::move(repository)), ceilings_(ceilings) {
}

bool QuotaEnforcer::IsFull(const db::model::StorageProfileRecord& profile) const {
  return profile.usage_bytes >= ceilings_.For(profile.plan);
}

void QuotaEnforcer::Check(const std::string& owner_id) const {
  std::optional<db::model::StorageProfileRecord> profile;
  try {
    auto tx = repository_->Begin();
    profile = repository_->GetStorageProfile(*tx, owner_id);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(std::string("storage profile lookup failed: ") + e.what());
  }

  if (profile && IsFull(*profile)) {
    throw util::QuotaExceeded("storage quota exceeded for owner " + owner_id);
  }
}

} // namespace telemetry::quota
