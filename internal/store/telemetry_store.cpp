#include "telemetry_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/quota/plan_ceilings.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::store {

namespace {

void ThrowIfFailed(const db::Result& r, const char* step) {
  if (r) return;
  throw util::StorageUnavailable(std::string(step) + " failed: " + db::ToString(r.code) + (r.message.empty() ? "" : " " + r.message));
}

} // namespace

TelemetryStore::TelemetryStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

uint64_t TelemetryStore::UsageCharge(const db::model::SampleRecord& sample) {
  return quota::kWriteOverheadBytes + sample.raw_payload.size();
}

db::model::SampleRecord TelemetryStore::Append(db::model::SampleRecord sample, const std::string& owner_id, const std::string& device_ip) {
  try {
    auto tx = repository_->Begin();

    sample.received_at_ms = util::ToUnixMillis(clock_->Now());

    ThrowIfFailed(repository_->AppendSample(*tx, sample), "append sample");
    ThrowIfFailed(repository_->TouchDevice(*tx, sample.serial, sample.received_at_ms, device_ip), "touch device");
    ThrowIfFailed(repository_->AddStorageUsage(*tx, owner_id, UsageCharge(sample)), "add storage usage");

    tx->Commit();
    return sample;
  } catch (const util::StorageUnavailable& e) {
    TELEMETRY_LOG_ERROR("sample write failed", {observability::StringField("serial", sample.serial), observability::StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("sample write failed", {observability::StringField("serial", sample.serial), observability::StringField("error", e.what())});
    throw util::StorageUnavailable(std::string("sample write failed: ") + e.what());
  }
}

std::vector<db::model::SampleRecord> TelemetryStore::Range(const std::string& serial, util::TimePoint start, util::TimePoint end,
                                                           uint32_t limit) const {
  if (limit == 0) limit = kDefaultRangeLimit;
  limit = std::min(limit, kMaxRangeLimit);

  const auto start_ms = util::ToUnixMillis(start);
  const auto end_ms   = util::ToUnixMillis(end);
  if (end_ms <= start_ms) return {};

  try {
    auto tx  = repository_->Begin();
    auto out = repository_->ReadSamplesRange(*tx, serial, start_ms, end_ms, limit);
    tx->Commit();
    return out;
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(std::string("range query failed: ") + e.what());
  }
}

std::vector<db::model::SampleRecord> TelemetryStore::Recent(const std::string& serial, uint32_t n) const {
  n = std::min(n, kMaxRecent);
  if (n == 0) return {};

  try {
    auto tx  = repository_->Begin();
    auto out = repository_->ReadRecentSamples(*tx, serial, n);
    tx->Commit();
    return out;
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(std::string("recent query failed: ") + e.what());
  }
}

} // namespace telemetry::store
