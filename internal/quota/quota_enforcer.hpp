#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "plan_ceilings.hpp"

namespace telemetry::quota {

/*
  Blocks ingestion for owners whose cached usage reached the plan ceiling.

  Read-only: never recomputes usage on the request path. An owner without a
  profile is treated as FREE with zero usage.
*/
class QuotaEnforcer {
 public:
  QuotaEnforcer(std::shared_ptr<db::Repository> repository, PlanCeilings ceilings);

  // Throws QuotaExceeded when usage >= ceiling.
  void Check(const std::string& owner_id) const;

  bool IsFull(const db::model::StorageProfileRecord& profile) const;

  const PlanCeilings& ceilings() const {
    return ceilings_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  PlanCeilings                    ceilings_;
};

} // namespace telemetry::quota
