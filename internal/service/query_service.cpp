#include "query_service.hpp"

#include <chrono>

#include "internal/db/api/repository.hpp"
#include "internal/store/telemetry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace telemetry::service {

using namespace telemetry::gate::services::v1;

namespace {

constexpr auto kDefaultRangeSpan = std::chrono::hours(24);

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void QueryService::RequireDevice(const std::string& serial) const {
  if (serial.empty()) throw util::ValidationFailure("serial is required");

  std::optional<db::model::DeviceRecord> device;
  try {
    auto tx = ctx_.repository->Begin();
    device  = ctx_.repository->GetDevice(*tx, serial);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(std::string("device lookup failed: ") + e.what());
  }
  if (!device) throw util::NotFound("device not found: " + serial);
}

QueryRangeResponse QueryService::QueryRange(const QueryRangeRequest& req) {
  return ObserveRpc("TelemetryQueryService.QueryRange", req.serial(), [&] {
    RequireDevice(req.serial());

    // end defaults to now, start to one day before end
    const auto end   = req.has_end() ? util::FromProto(req.end()) : ctx_.clock->Now();
    const auto start = req.has_start() ? util::FromProto(req.start()) : end - kDefaultRangeSpan;
    if (!(start < end)) throw util::ValidationFailure("start must be before end");

    QueryRangeResponse resp;
    for (const auto& sample : ctx_.store->Range(req.serial(), start, end, req.limit())) {
      *resp.add_samples() = ToProto(sample);
    }
    return resp;
  });
}

QueryRecentResponse QueryService::QueryRecent(const QueryRecentRequest& req) {
  return ObserveRpc("TelemetryQueryService.QueryRecent", req.serial(), [&] {
    RequireDevice(req.serial());

    QueryRecentResponse resp;
    for (const auto& sample : ctx_.store->Recent(req.serial(), req.count() == 0 ? 1 : req.count())) {
      *resp.add_samples() = ToProto(sample);
    }
    return resp;
  });
}

} // namespace telemetry::service
