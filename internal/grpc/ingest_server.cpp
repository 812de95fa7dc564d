#include "ingest_server.hpp"
#include "grpc_error.hpp"
#include "peer_address.hpp"

namespace telemetry::grpc {

IngestServer::IngestServer(std::shared_ptr<telemetry::service::IngestService> svc)
    : service_(std::move(svc)) {}

::grpc::Status IngestServer::Ingest(::grpc::ServerContext* context,
                                    const telemetry::gate::v1::TelemetryBody* req,
                                    telemetry::gate::v1::IngestResponse* resp) {
  try {
    *resp = service_->Ingest(ClientMetadata(*context, "authorization"), DeviceAddress(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::IngestJson(::grpc::ServerContext* context,
                                        const telemetry::gate::v1::RawTelemetryBody* req,
                                        telemetry::gate::v1::IngestResponse* resp) {
  try {
    *resp = service_->IngestJson(ClientMetadata(*context, "authorization"), DeviceAddress(*context), req->json());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
