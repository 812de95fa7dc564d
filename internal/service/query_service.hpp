#pragma once

#include "service_context.hpp"
#include "telemetry/gate/services/v1/telemetry_query_service.pb.h"

namespace telemetry::service {

/*
  Read-only telemetry access for dashboards and export. Never gated by
  quota: an owner over the ceiling can still read everything.
*/
class QueryService {
public:
  explicit QueryService(ServiceContext ctx);

  telemetry::gate::services::v1::QueryRangeResponse
  QueryRange(const telemetry::gate::services::v1::QueryRangeRequest& req);

  telemetry::gate::services::v1::QueryRecentResponse
  QueryRecent(const telemetry::gate::services::v1::QueryRecentRequest& req);

private:
  void RequireDevice(const std::string& serial) const;

  ServiceContext ctx_;
};

}
