#pragma once

#include <string>

#include "service_context.hpp"
#include "telemetry/gate/services/v1/telemetry_ingest_service.pb.h"

namespace telemetry::service {

class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  telemetry::gate::services::v1::IngestResponse
  Ingest(const std::string& authorization, const std::string& peer, const telemetry::gate::services::v1::TelemetryBody& body);

  // Parses `json` into a TelemetryBody; the text itself becomes the raw payload.
  telemetry::gate::services::v1::IngestResponse
  IngestJson(const std::string& authorization, const std::string& peer, const std::string& json);

private:
  telemetry::gate::services::v1::IngestResponse Run(const std::string& authorization, const std::string& peer,
                                                    telemetry::gate::services::v1::TelemetryBody body, std::string raw_payload,
                                                    std::string parse_error);

  ServiceContext ctx_;
};

}
