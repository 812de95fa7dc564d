#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/ingest_service.hpp"
#include "telemetry/gate/v1.hpp"

namespace telemetry::grpc {

/*
  Device-facing endpoint. The credential travels in the "authorization"
  metadata entry as "Device <serial>:<secret>".
*/
class IngestServer final : public telemetry::gate::v1::TelemetryIngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<telemetry::service::IngestService> svc);

  ::grpc::Status Ingest(::grpc::ServerContext*,
                        const telemetry::gate::v1::TelemetryBody*,
                        telemetry::gate::v1::IngestResponse*) override;

  ::grpc::Status IngestJson(::grpc::ServerContext*,
                            const telemetry::gate::v1::RawTelemetryBody*,
                            telemetry::gate::v1::IngestResponse*) override;

private:
  std::shared_ptr<telemetry::service::IngestService> service_;
};

}
