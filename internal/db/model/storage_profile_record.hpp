#pragma once

#include <cstdint>
#include <string>

#include "telemetry/gate/core/v1/types.pb.h"

namespace telemetry::db::model {

/*
  Per-owner plan and cached usage.

  usage_bytes is an estimate maintained incrementally on write and replaced
  by the usage recomputer; it is read, never recomputed, on ingestion.
*/
struct StorageProfileRecord {
  std::string owner_id;

  telemetry::gate::core::v1::StoragePlan plan = telemetry::gate::core::v1::STORAGE_PLAN_FREE;

  uint64_t usage_bytes = 0;

  // 0 = never recomputed
  uint64_t usage_recomputed_at_ms = 0;
};

// Aggregates feeding the usage recompute formula.
struct OwnerUsageStats {
  uint64_t sample_count = 0;

  // average raw payload length over the newest samples
  double average_payload_bytes = 0.0;
};

}
