#include "client/cpp/telemetry_client.h"

#include <arrow/array.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using telemetry::gate::client::TelemetryClient;

telemetry::gate::v1::TelemetrySample MakeSample(uint64_t id, bool with_optionals) {
  telemetry::gate::v1::TelemetrySample s;
  s.set_id(id);
  s.set_serial("TH-001");
  s.set_mode(telemetry::gate::v1::MODE_COOL);
  s.set_setpoint_c(23.0);
  s.set_temp_inside_c(25.5);
  s.set_hysteresis_c(0.5);
  s.set_output(telemetry::gate::v1::OUTPUT_COOL_ON);
  s.mutable_received_at()->set_seconds(1705314600);
  s.mutable_received_at()->set_nanos(250000000);
  s.set_raw_payload("{}");
  if (with_optionals) {
    s.set_temp_outside_c(31.0);
    s.set_humidity_percent(55.0);
    s.mutable_device_timestamp()->set_seconds(1705314599);
  }
  return s;
}

TelemetryClient UnreachableClient() {
  auto channel = grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials());
  return TelemetryClient(channel);
}

void TestMakeAuthorizationFormatsHeader() {
  const auto auth = TelemetryClient::MakeAuthorization("TH-001", "s3cret");
  assert(auth.ok());
  assert(*auth == "Device TH-001:s3cret");
}

void TestMakeAuthorizationRejectsBadParts() {
  assert(TelemetryClient::MakeAuthorization("", "s3cret").status().IsInvalid());
  assert(TelemetryClient::MakeAuthorization("TH-001", "").status().IsInvalid());
  assert(TelemetryClient::MakeAuthorization("TH:001", "s3cret").status().IsInvalid());
}

void TestSamplesToRecordBatchShape() {
  const auto batch = TelemetryClient::SamplesToRecordBatch({MakeSample(1, true), MakeSample(2, false)});
  assert(batch.ok());

  const auto& rb = *batch;
  assert(rb->num_rows() == 2);
  assert(rb->num_columns() == 12);
  assert(rb->schema()->field(0)->name() == "id");
  assert(rb->schema()->field(11)->name() == "raw_payload");

  const auto ids = std::static_pointer_cast<arrow::UInt64Array>(rb->GetColumnByName("id"));
  assert(ids->Value(0) == 1 && ids->Value(1) == 2);

  const auto mode = std::static_pointer_cast<arrow::StringArray>(rb->GetColumnByName("mode"));
  assert(mode->GetString(0) == "MODE_COOL");

  const auto outside = rb->GetColumnByName("temp_outside_c");
  assert(outside->null_count() == 1);
  assert(outside->IsValid(0) && outside->IsNull(1));

  const auto device_ts = rb->GetColumnByName("device_timestamp");
  assert(device_ts->IsValid(0) && device_ts->IsNull(1));

  const auto received = std::static_pointer_cast<arrow::TimestampArray>(rb->GetColumnByName("received_at"));
  assert(received->Value(0) == 1705314600250);
}

void TestSamplesToRecordBatchEmpty() {
  const auto batch = TelemetryClient::SamplesToRecordBatch({});
  assert(batch.ok());
  assert((*batch)->num_rows() == 0);
  assert((*batch)->num_columns() == 12);
}

void TestExportRejectsEmptyWindowBeforeGrpcCall() {
  auto       client = UnreachableClient();
  const auto now    = std::chrono::system_clock::now();
  const auto path   = (std::filesystem::temp_directory_path() / "telemetry_client_empty_export.arrow").string();

  const auto exported = client.ExportRange("TH-001", now, now, path);
  assert(!exported.ok());
  assert(exported.status().IsInvalid());
  assert(!std::filesystem::exists(path));
}

void TestUnreachableServerIsIOError() {
  auto client = UnreachableClient();

  telemetry::gate::v1::QueryRecentRequest req;
  req.set_serial("TH-001");
  const auto recent = client.QueryRecent(req);
  assert(!recent.ok());
  assert(recent.status().IsIOError());

  telemetry::gate::v1::TelemetryBody body;
  const auto ingest = client.Ingest("Device TH-001:x", body);
  assert(!ingest.ok());
  assert(ingest.status().IsIOError());
}

} // namespace

int main() {
  TestMakeAuthorizationFormatsHeader();
  TestMakeAuthorizationRejectsBadParts();
  TestSamplesToRecordBatchShape();
  TestSamplesToRecordBatchEmpty();
  TestExportRejectsEmptyWindowBeforeGrpcCall();
  TestUnreachableServerIsIOError();

  std::cout << "telemetry_unit_client: pass\n";
  return 0;
}
