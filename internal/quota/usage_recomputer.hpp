#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace telemetry::quota {

/*
  Replaces an owner's cached usage with an estimate derived from stored
  samples:

      usage = count * (row + avg(raw length over newest 100) + index)

  Runs out of band: from the periodic refresh worker and on operator
  request. Never on the ingestion path.
*/
class UsageRecomputer {
 public:
  UsageRecomputer(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock);

  db::model::StorageProfileRecord RecomputeOwner(const std::string& owner_id);

  // Recomputes every profile whose figure is older than `staleness`.
  std::vector<db::model::StorageProfileRecord> RecomputeStale(std::chrono::milliseconds staleness);

  std::vector<db::model::StorageProfileRecord> RecomputeAll();

  static uint64_t Estimate(const db::model::OwnerUsageStats& stats);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<util::ClockSource> clock_;
};

} // namespace telemetry::quota
