#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace telemetry::store {

/*
  Durable append-only sample store.

  Append() is one transaction:
      receipt time := clock.Now()
      insert sample            (backend assigns id)
      touch device last-seen   (time, address)
      owner usage += 300 + raw length
  Any backend failure becomes StorageUnavailable and nothing is kept.
*/
class TelemetryStore {
 public:
  static constexpr uint32_t kDefaultRangeLimit = 100;
  static constexpr uint32_t kMaxRangeLimit     = 10000;
  static constexpr uint32_t kMaxRecent         = 1000;

  TelemetryStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock);

  // Fills in id and received_at_ms.
  db::model::SampleRecord Append(db::model::SampleRecord sample, const std::string& owner_id, const std::string& device_ip);

  // start <= received_at < end, ascending. limit 0 means the default.
  std::vector<db::model::SampleRecord> Range(const std::string& serial, util::TimePoint start, util::TimePoint end, uint32_t limit) const;

  // n newest, newest first.
  std::vector<db::model::SampleRecord> Recent(const std::string& serial, uint32_t n) const;

  static uint64_t UsageCharge(const db::model::SampleRecord& sample);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<util::ClockSource> clock_;
};

} // namespace telemetry::store
