#pragma once

#include <arrow/record_batch.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "telemetry/gate/v1.hpp"

namespace telemetry::gate::client {

/*
  Typed wrapper over the three gate services.

  Every call returns an arrow::Status / arrow::Result; gRPC failures become
  IOError (KeyError for NOT_FOUND, Invalid for INVALID_ARGUMENT,
  AlreadyExists for ALREADY_EXISTS) carrying the server message.
*/
class TelemetryClient {
 public:
  explicit TelemetryClient(std::shared_ptr<grpc::Channel> channel);

  // "Device <serial>:<secret>"; Invalid for an empty part or ':' in the serial.
  static arrow::Result<std::string> MakeAuthorization(const std::string& serial, const std::string& secret);

  // Columnar view of samples: one row per sample, optional readings as nulls.
  static arrow::Result<std::shared_ptr<arrow::RecordBatch>> SamplesToRecordBatch(
      const std::vector<telemetry::gate::v1::TelemetrySample>& samples);

  // ---------------------------------------------------------------------
  // Ingest (device side)
  // ---------------------------------------------------------------------

  arrow::Result<telemetry::gate::v1::IngestResponse> Ingest(const std::string&                        authorization,
                                                            const telemetry::gate::v1::TelemetryBody& body) const;

  arrow::Result<telemetry::gate::v1::IngestResponse> IngestJson(const std::string& authorization, const std::string& json) const;

  // ---------------------------------------------------------------------
  // Query
  // ---------------------------------------------------------------------

  arrow::Result<telemetry::gate::v1::QueryRangeResponse> QueryRange(const telemetry::gate::v1::QueryRangeRequest& request) const;

  arrow::Result<telemetry::gate::v1::QueryRecentResponse> QueryRecent(const telemetry::gate::v1::QueryRecentRequest& request) const;

  // Pages through [start, end) and writes every sample to an Arrow IPC file.
  // Returns the number of rows written.
  arrow::Result<int64_t> ExportRange(const std::string& serial, std::chrono::system_clock::time_point start,
                                     std::chrono::system_clock::time_point end, const std::string& path) const;

  // ---------------------------------------------------------------------
  // Administration
  // ---------------------------------------------------------------------

  arrow::Result<telemetry::gate::v1::UpsertAccountResponse> UpsertAccount(const telemetry::gate::v1::UpsertAccountRequest& request) const;

  arrow::Result<telemetry::gate::v1::RegisterDeviceResponse> RegisterDevice(
      const telemetry::gate::v1::RegisterDeviceRequest& request) const;

  arrow::Result<telemetry::gate::v1::RenameDeviceResponse> RenameDevice(const telemetry::gate::v1::RenameDeviceRequest& request) const;

  arrow::Result<telemetry::gate::v1::GetDeviceResponse> GetDevice(const telemetry::gate::v1::GetDeviceRequest& request) const;

  arrow::Result<telemetry::gate::v1::RotateCredentialResponse> RotateCredential(
      const telemetry::gate::v1::RotateCredentialRequest& request) const;

  arrow::Result<telemetry::gate::v1::RevokeCredentialResponse> RevokeCredential(
      const telemetry::gate::v1::RevokeCredentialRequest& request) const;

  arrow::Result<telemetry::gate::v1::ListCredentialsResponse> ListCredentials(
      const telemetry::gate::v1::ListCredentialsRequest& request) const;

  arrow::Result<telemetry::gate::v1::GetAlertSettingsResponse> GetAlertSettings(
      const telemetry::gate::v1::GetAlertSettingsRequest& request) const;

  arrow::Result<telemetry::gate::v1::UpdateAlertSettingsResponse> UpdateAlertSettings(
      const telemetry::gate::v1::UpdateAlertSettingsRequest& request) const;

  arrow::Result<telemetry::gate::v1::GetStorageProfileResponse> GetStorageProfile(
      const telemetry::gate::v1::GetStorageProfileRequest& request) const;

  arrow::Result<telemetry::gate::v1::SetStoragePlanResponse> SetStoragePlan(
      const telemetry::gate::v1::SetStoragePlanRequest& request) const;

  arrow::Result<telemetry::gate::v1::RecomputeUsageResponse> RecomputeUsage(
      const telemetry::gate::v1::RecomputeUsageRequest& request) const;

 private:
  std::unique_ptr<telemetry::gate::v1::TelemetryIngestService::Stub> ingest_stub_;
  std::unique_ptr<telemetry::gate::v1::TelemetryQueryService::Stub>  query_stub_;
  std::unique_ptr<telemetry::gate::v1::DeviceAdminService::Stub>     admin_stub_;
};

} // namespace telemetry::gate::client
