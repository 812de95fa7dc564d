#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace telemetry::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace telemetry::util;

  if (dynamic_cast<const AuthenticationFailure*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const RateLimitExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const QuotaExceeded*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const ValidationFailure*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StorageUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

int HttpStatusFor(const std::exception& e) {
  switch (ToStatus(e).error_code()) {
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return 401;
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return 429;
    case ::grpc::StatusCode::PERMISSION_DENIED:
      return 403;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return 400;
    case ::grpc::StatusCode::UNAVAILABLE:
      return 503;
    case ::grpc::StatusCode::NOT_FOUND:
      return 404;
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return 409;
    default:
      return 500;
  }
}

} // namespace telemetry::grpc
