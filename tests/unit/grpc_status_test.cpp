#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/peer_address.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/notify/log_alert_sink.hpp"
#include "internal/service/device_admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/util/errors.hpp"
#include "telemetry/gate/v1.hpp"

namespace {

telemetry::service::ServiceContext BuildServiceContext() {
  // the context keeps every component alive on its own
  auto app = telemetry::factory::Build({}, std::make_shared<telemetry::db::memory::MemoryRepository>(), std::make_shared<telemetry::util::ManualClock>(),
                                       std::make_shared<telemetry::notify::LogAlertSink>());
  return app.context;
}

void TestExceptionsMapToStatusCodes() {
  using namespace telemetry::util;
  using telemetry::grpc::HttpStatusFor;
  using telemetry::grpc::ToStatus;

  assert(ToStatus(AuthenticationFailure("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(RateLimitExceeded("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(QuotaExceeded("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(ValidationFailure("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(StorageUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(std::logic_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(ValidationFailure("missing required field: mode")).error_message() == "missing required field: mode");

  assert(HttpStatusFor(AuthenticationFailure("x")) == 401);
  assert(HttpStatusFor(RateLimitExceeded("x")) == 429);
  assert(HttpStatusFor(QuotaExceeded("x")) == 403);
  assert(HttpStatusFor(ValidationFailure("x")) == 400);
  assert(HttpStatusFor(StorageUnavailable("x")) == 503);
  assert(HttpStatusFor(NotFound("x")) == 404);
  assert(HttpStatusFor(AlreadyExists("x")) == 409);
  assert(HttpStatusFor(std::runtime_error("x")) == 500);
}

void TestPeerNormalization() {
  using telemetry::grpc::NormalizePeer;

  assert(NormalizePeer("ipv4:10.0.0.7:5000") == "10.0.0.7");
  assert(NormalizePeer("ipv6:[::1]:5000") == "::1");
  assert(NormalizePeer("ipv6:%5B2001:db8::2%5D:443") == "2001:db8::2");
  assert(NormalizePeer("unix:/tmp/gate.sock").empty());
  assert(NormalizePeer("").empty());
}

void TestIngestWithoutCredentialsReturnsUnauthenticated() {
  auto ctx = BuildServiceContext();
  telemetry::grpc::IngestServer server(std::make_shared<telemetry::service::IngestService>(ctx));

  telemetry::gate::v1::TelemetryBody req;
  req.set_mode("HEAT");
  req.set_setpoint_c(21.0);
  req.set_temp_inside_c(20.0);
  req.set_output("HEAT_ON");
  telemetry::gate::v1::IngestResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.Ingest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  telemetry::gate::v1::RawTelemetryBody raw;
  raw.set_json("{}");
  ::grpc::ServerContext json_ctx;
  assert(server.IngestJson(&json_ctx, &raw, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestQueryUnknownDeviceReturnsNotFound() {
  auto ctx = BuildServiceContext();
  telemetry::grpc::QueryServer server(std::make_shared<telemetry::service::QueryService>(ctx));

  telemetry::gate::v1::QueryRecentRequest req;
  req.set_serial("TH-404");
  telemetry::gate::v1::QueryRecentResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.QueryRecent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAdminValidationAndConflicts() {
  auto ctx = BuildServiceContext();
  telemetry::grpc::AdminServer server(std::make_shared<telemetry::service::DeviceAdminService>(ctx));

  telemetry::gate::v1::UpsertAccountRequest account;
  account.mutable_account()->set_id("owner-grpc");
  telemetry::gate::v1::UpsertAccountResponse account_resp;
  ::grpc::ServerContext                      account_ctx;
  assert(server.UpsertAccount(&account_ctx, &account, &account_resp).ok());

  telemetry::gate::v1::RegisterDeviceRequest req;
  req.set_serial("TH-GRPC");
  req.set_owner_id("owner-grpc");
  telemetry::gate::v1::RegisterDeviceResponse resp;

  ::grpc::ServerContext first_ctx;
  assert(server.RegisterDevice(&first_ctx, &req, &resp).ok());
  assert(!resp.secret().empty());

  ::grpc::ServerContext second_ctx;
  assert(server.RegisterDevice(&second_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  req.set_serial("bad:serial");
  ::grpc::ServerContext bad_ctx;
  assert(server.RegisterDevice(&bad_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  telemetry::gate::v1::GetDeviceRequest get;
  get.set_serial("TH-404");
  telemetry::gate::v1::GetDeviceResponse get_resp;
  ::grpc::ServerContext                  get_ctx;
  assert(server.GetDevice(&get_ctx, &get, &get_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestPeerNormalization();
  TestIngestWithoutCredentialsReturnsUnauthenticated();
  TestQueryUnknownDeviceReturnsNotFound();
  TestAdminValidationAndConflicts();

  std::cout << "telemetry_unit_grpc_status: pass\n";
  return 0;
}
