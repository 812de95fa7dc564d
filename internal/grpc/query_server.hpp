#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/query_service.hpp"
#include "telemetry/gate/v1.hpp"

namespace telemetry::grpc {

class QueryServer final : public telemetry::gate::v1::TelemetryQueryService::Service {
public:
  explicit QueryServer(std::shared_ptr<telemetry::service::QueryService> svc);

  ::grpc::Status QueryRange(::grpc::ServerContext*,
                            const telemetry::gate::v1::QueryRangeRequest*,
                            telemetry::gate::v1::QueryRangeResponse*) override;

  ::grpc::Status QueryRecent(::grpc::ServerContext*,
                             const telemetry::gate::v1::QueryRecentRequest*,
                             telemetry::gate::v1::QueryRecentResponse*) override;

private:
  std::shared_ptr<telemetry::service::QueryService> service_;
};

}
