#include "client/cpp/telemetry_client.h"

#include <arrow/builder.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>
#include <arrow/type.h>
#include <grpcpp/client_context.h>

#include <string>
#include <string_view>

namespace telemetry::gate::client {

namespace {

namespace v1 = telemetry::gate::v1;

// server-side range cap; a full page means there may be more
constexpr uint32_t kExportPageSize = 10000;

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::ALREADY_EXISTS:
      return arrow::Status::AlreadyExists(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed (", static_cast<int>(status.error_code()), "): ",
                                    status.error_message());
  }
}

int64_t TimestampMillis(const google::protobuf::Timestamp& ts) {
  return ts.seconds() * 1000 + ts.nanos() / 1000000;
}

google::protobuf::Timestamp ToTimestamp(std::chrono::system_clock::time_point tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  google::protobuf::Timestamp ts;
  ts.set_seconds(ms / 1000);
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

std::shared_ptr<arrow::Schema> SampleSchema() {
  return arrow::schema({
      arrow::field("id", arrow::uint64(), false),
      arrow::field("serial", arrow::utf8(), false),
      arrow::field("mode", arrow::utf8(), false),
      arrow::field("setpoint_c", arrow::float64(), false),
      arrow::field("temp_inside_c", arrow::float64(), false),
      arrow::field("temp_outside_c", arrow::float64(), true),
      arrow::field("humidity_percent", arrow::float64(), true),
      arrow::field("hysteresis_c", arrow::float64(), false),
      arrow::field("output", arrow::utf8(), false),
      arrow::field("device_timestamp", arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"), true),
      arrow::field("received_at", arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"), false),
      arrow::field("raw_payload", arrow::utf8(), false),
  });
}

} // namespace

TelemetryClient::TelemetryClient(std::shared_ptr<grpc::Channel> channel)
    : ingest_stub_(v1::TelemetryIngestService::NewStub(channel)),
      query_stub_(v1::TelemetryQueryService::NewStub(channel)),
      admin_stub_(v1::DeviceAdminService::NewStub(channel)) {}

arrow::Result<std::string> TelemetryClient::MakeAuthorization(const std::string& serial, const std::string& secret) {
  if (serial.empty() || secret.empty()) {
    return arrow::Status::Invalid("serial and secret are both required");
  }
  if (serial.find(':') != std::string::npos) {
    return arrow::Status::Invalid("serial must not contain ':'");
  }
  return "Device " + serial + ":" + secret;
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> TelemetryClient::SamplesToRecordBatch(const std::vector<v1::TelemetrySample>& samples) {
  auto* pool = arrow::default_memory_pool();

  arrow::UInt64Builder    id(pool);
  arrow::StringBuilder    serial(pool), mode(pool), output(pool), raw_payload(pool);
  arrow::DoubleBuilder    setpoint(pool), inside(pool), outside(pool), humidity(pool), hysteresis(pool);
  arrow::TimestampBuilder device_ts(arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"), pool);
  arrow::TimestampBuilder received_at(arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"), pool);

  for (const auto& s : samples) {
    ARROW_RETURN_NOT_OK(id.Append(s.id()));
    ARROW_RETURN_NOT_OK(serial.Append(s.serial()));
    ARROW_RETURN_NOT_OK(mode.Append(v1::Mode_Name(s.mode())));
    ARROW_RETURN_NOT_OK(setpoint.Append(s.setpoint_c()));
    ARROW_RETURN_NOT_OK(inside.Append(s.temp_inside_c()));
    ARROW_RETURN_NOT_OK(s.has_temp_outside_c() ? outside.Append(s.temp_outside_c()) : outside.AppendNull());
    ARROW_RETURN_NOT_OK(s.has_humidity_percent() ? humidity.Append(s.humidity_percent()) : humidity.AppendNull());
    ARROW_RETURN_NOT_OK(hysteresis.Append(s.hysteresis_c()));
    ARROW_RETURN_NOT_OK(output.Append(v1::Output_Name(s.output())));
    ARROW_RETURN_NOT_OK(s.has_device_timestamp() ? device_ts.Append(TimestampMillis(s.device_timestamp())) : device_ts.AppendNull());
    ARROW_RETURN_NOT_OK(received_at.Append(TimestampMillis(s.received_at())));
    ARROW_RETURN_NOT_OK(raw_payload.Append(s.raw_payload()));
  }

  std::vector<std::shared_ptr<arrow::Array>> columns;
  for (arrow::ArrayBuilder* builder : std::initializer_list<arrow::ArrayBuilder*>{&id, &serial, &mode, &setpoint, &inside, &outside, &humidity,
                                                                                  &hysteresis, &output, &device_ts, &received_at, &raw_payload}) {
    std::shared_ptr<arrow::Array> column;
    ARROW_RETURN_NOT_OK(builder->Finish(&column));
    columns.push_back(std::move(column));
  }

  return arrow::RecordBatch::Make(SampleSchema(), static_cast<int64_t>(samples.size()), std::move(columns));
}

// ---------------------------------------------------------------------
// Ingest
// ---------------------------------------------------------------------

arrow::Result<v1::IngestResponse> TelemetryClient::Ingest(const std::string& authorization, const v1::TelemetryBody& body) const {
  v1::IngestResponse  response;
  grpc::ClientContext ctx;
  ctx.AddMetadata("authorization", authorization);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->Ingest(&ctx, body, &response), "Ingest"));
  return response;
}

arrow::Result<v1::IngestResponse> TelemetryClient::IngestJson(const std::string& authorization, const std::string& json) const {
  v1::RawTelemetryBody request;
  request.set_json(json);

  v1::IngestResponse  response;
  grpc::ClientContext ctx;
  ctx.AddMetadata("authorization", authorization);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->IngestJson(&ctx, request, &response), "IngestJson"));
  return response;
}

// ---------------------------------------------------------------------
// Query
// ---------------------------------------------------------------------

arrow::Result<v1::QueryRangeResponse> TelemetryClient::QueryRange(const v1::QueryRangeRequest& request) const {
  v1::QueryRangeResponse response;
  grpc::ClientContext    ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(query_stub_->QueryRange(&ctx, request, &response), "QueryRange"));
  return response;
}

arrow::Result<v1::QueryRecentResponse> TelemetryClient::QueryRecent(const v1::QueryRecentRequest& request) const {
  v1::QueryRecentResponse response;
  grpc::ClientContext     ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(query_stub_->QueryRecent(&ctx, request, &response), "QueryRecent"));
  return response;
}

arrow::Result<int64_t> TelemetryClient::ExportRange(const std::string& serial, std::chrono::system_clock::time_point start,
                                                    std::chrono::system_clock::time_point end, const std::string& path) const {
  if (!(start < end)) {
    return arrow::Status::Invalid("export window is empty");
  }

  std::vector<v1::TelemetrySample> samples;
  v1::QueryRangeRequest            request;
  request.set_serial(serial);
  *request.mutable_end() = ToTimestamp(end);
  request.set_limit(kExportPageSize);

  // Pages restart at the last receipt time seen; rows sharing that
  // millisecond are skipped by id.
  auto     page_start = start;
  uint64_t last_id    = 0;
  while (true) {
    *request.mutable_start() = ToTimestamp(page_start);
    ARROW_ASSIGN_OR_RAISE(auto page, QueryRange(request));

    std::size_t added = 0;
    for (const auto& sample : page.samples()) {
      if (last_id != 0 && sample.id() <= last_id && TimestampMillis(sample.received_at()) == TimestampMillis(request.start())) continue;
      samples.push_back(sample);
      ++added;
    }

    if (page.samples_size() < static_cast<int>(kExportPageSize)) break;
    if (added == 0) {
      return arrow::Status::CapacityError("more than ", kExportPageSize, " samples share one receipt millisecond");
    }

    const auto& last = page.samples(page.samples_size() - 1);
    last_id          = last.id();
    page_start       = std::chrono::system_clock::time_point(std::chrono::milliseconds(TimestampMillis(last.received_at())));
  }

  ARROW_ASSIGN_OR_RAISE(auto batch, SamplesToRecordBatch(samples));
  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(out, batch->schema()));
  ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
  ARROW_RETURN_NOT_OK(writer->Close());
  ARROW_RETURN_NOT_OK(out->Close());

  return batch->num_rows();
}

// ---------------------------------------------------------------------
// Administration
// ---------------------------------------------------------------------

arrow::Result<v1::UpsertAccountResponse> TelemetryClient::UpsertAccount(const v1::UpsertAccountRequest& request) const {
  v1::UpsertAccountResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->UpsertAccount(&ctx, request, &response), "UpsertAccount"));
  return response;
}

arrow::Result<v1::RegisterDeviceResponse> TelemetryClient::RegisterDevice(const v1::RegisterDeviceRequest& request) const {
  v1::RegisterDeviceResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->RegisterDevice(&ctx, request, &response), "RegisterDevice"));
  return response;
}

arrow::Result<v1::RenameDeviceResponse> TelemetryClient::RenameDevice(const v1::RenameDeviceRequest& request) const {
  v1::RenameDeviceResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->RenameDevice(&ctx, request, &response), "RenameDevice"));
  return response;
}

arrow::Result<v1::GetDeviceResponse> TelemetryClient::GetDevice(const v1::GetDeviceRequest& request) const {
  v1::GetDeviceResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetDevice(&ctx, request, &response), "GetDevice"));
  return response;
}

arrow::Result<v1::RotateCredentialResponse> TelemetryClient::RotateCredential(const v1::RotateCredentialRequest& request) const {
  v1::RotateCredentialResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->RotateCredential(&ctx, request, &response), "RotateCredential"));
  return response;
}

arrow::Result<v1::RevokeCredentialResponse> TelemetryClient::RevokeCredential(const v1::RevokeCredentialRequest& request) const {
  v1::RevokeCredentialResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->RevokeCredential(&ctx, request, &response), "RevokeCredential"));
  return response;
}

arrow::Result<v1::ListCredentialsResponse> TelemetryClient::ListCredentials(const v1::ListCredentialsRequest& request) const {
  v1::ListCredentialsResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListCredentials(&ctx, request, &response), "ListCredentials"));
  return response;
}

arrow::Result<v1::GetAlertSettingsResponse> TelemetryClient::GetAlertSettings(const v1::GetAlertSettingsRequest& request) const {
  v1::GetAlertSettingsResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetAlertSettings(&ctx, request, &response), "GetAlertSettings"));
  return response;
}

arrow::Result<v1::UpdateAlertSettingsResponse> TelemetryClient::UpdateAlertSettings(const v1::UpdateAlertSettingsRequest& request) const {
  v1::UpdateAlertSettingsResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->UpdateAlertSettings(&ctx, request, &response), "UpdateAlertSettings"));
  return response;
}

arrow::Result<v1::GetStorageProfileResponse> TelemetryClient::GetStorageProfile(const v1::GetStorageProfileRequest& request) const {
  v1::GetStorageProfileResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetStorageProfile(&ctx, request, &response), "GetStorageProfile"));
  return response;
}

arrow::Result<v1::SetStoragePlanResponse> TelemetryClient::SetStoragePlan(const v1::SetStoragePlanRequest& request) const {
  v1::SetStoragePlanResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->SetStoragePlan(&ctx, request, &response), "SetStoragePlan"));
  return response;
}

arrow::Result<v1::RecomputeUsageResponse> TelemetryClient::RecomputeUsage(const v1::RecomputeUsageRequest& request) const {
  v1::RecomputeUsageResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->RecomputeUsage(&ctx, request, &response), "RecomputeUsage"));
  return response;
}

} // namespace telemetry::gate::client
