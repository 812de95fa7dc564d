#pragma once

#include <cstdint>
#include <string>

namespace telemetry::db::model {

/*
  Device identity row.

  last_seen_ms / last_ip are touched by every accepted ingestion.
  Devices are never hard-deleted while telemetry references them.
*/
struct DeviceRecord {
  std::string serial;
  std::string owner_id;
  std::string name;

  uint64_t created_at_ms = 0;

  // 0 = never seen
  uint64_t    last_seen_ms = 0;
  std::string last_ip;
};

}
