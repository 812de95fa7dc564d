#pragma once

#include <cstdint>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::quota {

constexpr uint64_t kGiB = 1024ull * 1024ull * 1024ull;

struct PlanCeilings {
  uint64_t free_bytes     = 2 * kGiB;
  uint64_t standard_bytes = 10 * kGiB;
  uint64_t premium_bytes  = 1024 * kGiB;

  uint64_t For(telemetry::gate::core::v1::StoragePlan plan) const {
    switch (plan) {
      case telemetry::gate::core::v1::STORAGE_PLAN_STANDARD:
        return standard_bytes;
      case telemetry::gate::core::v1::STORAGE_PLAN_PREMIUM:
        return premium_bytes;
      case telemetry::gate::core::v1::STORAGE_PLAN_FREE:
      default:
        return free_bytes;
    }
  }
};

/*
  Byte estimates. A stored sample costs a fixed row overhead plus its raw
  body; the recompute formula splits that overhead into row + index parts.
*/
constexpr uint64_t kWriteOverheadBytes     = 300;
constexpr uint64_t kRecomputeRowBytes      = 200;
constexpr uint64_t kRecomputeIndexBytes    = 100;
constexpr uint32_t kRecomputeAverageWindow = 100;

} // namespace telemetry::quota
