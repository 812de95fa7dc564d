#pragma once

#include "service_context.hpp"
#include "telemetry/gate/services/v1/device_admin_service.pb.h"

namespace telemetry::service {

/*
  Operator / collaborator surface: accounts, devices, credentials, alert
  settings and storage profiles.
*/
class DeviceAdminService {
public:
  explicit DeviceAdminService(ServiceContext ctx);

  telemetry::gate::services::v1::UpsertAccountResponse
  UpsertAccount(const telemetry::gate::services::v1::UpsertAccountRequest& req);

  // Device + default alert settings + first credential, atomically.
  telemetry::gate::services::v1::RegisterDeviceResponse
  RegisterDevice(const telemetry::gate::services::v1::RegisterDeviceRequest& req);

  telemetry::gate::services::v1::RenameDeviceResponse
  RenameDevice(const telemetry::gate::services::v1::RenameDeviceRequest& req);

  telemetry::gate::services::v1::GetDeviceResponse
  GetDevice(const telemetry::gate::services::v1::GetDeviceRequest& req);

  // Rate limited per device.
  telemetry::gate::services::v1::RotateCredentialResponse
  RotateCredential(const telemetry::gate::services::v1::RotateCredentialRequest& req);

  telemetry::gate::services::v1::RevokeCredentialResponse
  RevokeCredential(const telemetry::gate::services::v1::RevokeCredentialRequest& req);

  telemetry::gate::services::v1::ListCredentialsResponse
  ListCredentials(const telemetry::gate::services::v1::ListCredentialsRequest& req);

  telemetry::gate::services::v1::GetAlertSettingsResponse
  GetAlertSettings(const telemetry::gate::services::v1::GetAlertSettingsRequest& req);

  telemetry::gate::services::v1::UpdateAlertSettingsResponse
  UpdateAlertSettings(const telemetry::gate::services::v1::UpdateAlertSettingsRequest& req);

  telemetry::gate::services::v1::GetStorageProfileResponse
  GetStorageProfile(const telemetry::gate::services::v1::GetStorageProfileRequest& req);

  telemetry::gate::services::v1::SetStoragePlanResponse
  SetStoragePlan(const telemetry::gate::services::v1::SetStoragePlanRequest& req);

  telemetry::gate::services::v1::RecomputeUsageResponse
  RecomputeUsage(const telemetry::gate::services::v1::RecomputeUsageRequest& req);

private:
  ServiceContext ctx_;
};

}
