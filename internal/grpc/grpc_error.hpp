#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace telemetry::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Status the HTTP transcoding proxy answers with for the same exception.
int HttpStatusFor(const std::exception& e);

} // namespace telemetry::grpc
