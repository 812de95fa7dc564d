#include "ingest_service.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/pipeline/ingest_pipeline.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace telemetry::service {

using namespace telemetry::gate::services::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IngestResponse IngestService::Ingest(const std::string& authorization, const std::string& peer, const TelemetryBody& body) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string raw;
  if (!google::protobuf::util::MessageToJsonString(body, &raw, options).ok()) {
    raw.clear();
  }
  return Run(authorization, peer, body, std::move(raw), {});
}

IngestResponse IngestService::IngestJson(const std::string& authorization, const std::string& peer, const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  TelemetryBody body;
  std::string   parse_error;
  if (const auto status = google::protobuf::util::JsonStringToMessage(json, &body, options); !status.ok()) {
    body.Clear();
    parse_error = "invalid JSON: " + std::string(status.message());
  }
  return Run(authorization, peer, std::move(body), json, std::move(parse_error));
}

IngestResponse IngestService::Run(const std::string& authorization, const std::string& peer, TelemetryBody body, std::string raw_payload,
                                  std::string parse_error) {
  pipeline::IngestContext ctx;
  ctx.authorization = authorization;
  ctx.peer_address  = peer;
  ctx.arrived_at    = ctx_.clock->Now();
  ctx.body          = std::move(body);
  ctx.raw_payload   = std::move(raw_payload);
  ctx.parse_error   = std::move(parse_error);

  return ObserveRpc("TelemetryIngestService.Ingest", "", [&] {
    const auto result = ctx_.pipeline->Run(ctx);

    IngestResponse resp;
    resp.set_status("ok");
    resp.set_id(result.sample.id);
    *resp.mutable_server_ts() = util::ToProto(util::FromUnixMillis(result.sample.received_at_ms));
    return resp;
  });
}

} // namespace telemetry::service
