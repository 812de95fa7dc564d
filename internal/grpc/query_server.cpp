#include "query_server.hpp"
#include "grpc_error.hpp"

namespace telemetry::grpc {

QueryServer::QueryServer(std::shared_ptr<telemetry::service::QueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status QueryServer::QueryRange(::grpc::ServerContext*,
                                       const telemetry::gate::v1::QueryRangeRequest* req,
                                       telemetry::gate::v1::QueryRangeResponse* resp) {
  try {
    *resp = service_->QueryRange(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::QueryRecent(::grpc::ServerContext*,
                                        const telemetry::gate::v1::QueryRecentRequest* req,
                                        telemetry::gate::v1::QueryRecentResponse* resp) {
  try {
    *resp = service_->QueryRecent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
