#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/device_admin_service.hpp"
#include "telemetry/gate/v1.hpp"

namespace telemetry::grpc {

/*
  Operator surface. Expected to be bound to a private listener or fronted by
  an authenticating proxy; it performs no caller authentication itself.
*/
class AdminServer final : public telemetry::gate::v1::DeviceAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<telemetry::service::DeviceAdminService> svc);

  ::grpc::Status UpsertAccount(::grpc::ServerContext*,
                               const telemetry::gate::v1::UpsertAccountRequest*,
                               telemetry::gate::v1::UpsertAccountResponse*) override;

  ::grpc::Status RegisterDevice(::grpc::ServerContext*,
                                const telemetry::gate::v1::RegisterDeviceRequest*,
                                telemetry::gate::v1::RegisterDeviceResponse*) override;

  ::grpc::Status RenameDevice(::grpc::ServerContext*,
                              const telemetry::gate::v1::RenameDeviceRequest*,
                              telemetry::gate::v1::RenameDeviceResponse*) override;

  ::grpc::Status GetDevice(::grpc::ServerContext*,
                           const telemetry::gate::v1::GetDeviceRequest*,
                           telemetry::gate::v1::GetDeviceResponse*) override;

  ::grpc::Status RotateCredential(::grpc::ServerContext*,
                                  const telemetry::gate::v1::RotateCredentialRequest*,
                                  telemetry::gate::v1::RotateCredentialResponse*) override;

  ::grpc::Status RevokeCredential(::grpc::ServerContext*,
                                  const telemetry::gate::v1::RevokeCredentialRequest*,
                                  telemetry::gate::v1::RevokeCredentialResponse*) override;

  ::grpc::Status ListCredentials(::grpc::ServerContext*,
                                 const telemetry::gate::v1::ListCredentialsRequest*,
                                 telemetry::gate::v1::ListCredentialsResponse*) override;

  ::grpc::Status GetAlertSettings(::grpc::ServerContext*,
                                  const telemetry::gate::v1::GetAlertSettingsRequest*,
                                  telemetry::gate::v1::GetAlertSettingsResponse*) override;

  ::grpc::Status UpdateAlertSettings(::grpc::ServerContext*,
                                     const telemetry::gate::v1::UpdateAlertSettingsRequest*,
                                     telemetry::gate::v1::UpdateAlertSettingsResponse*) override;

  ::grpc::Status GetStorageProfile(::grpc::ServerContext*,
                                   const telemetry::gate::v1::GetStorageProfileRequest*,
                                   telemetry::gate::v1::GetStorageProfileResponse*) override;

  ::grpc::Status SetStoragePlan(::grpc::ServerContext*,
                                const telemetry::gate::v1::SetStoragePlanRequest*,
                                telemetry::gate::v1::SetStoragePlanResponse*) override;

  ::grpc::Status RecomputeUsage(::grpc::ServerContext*,
                                const telemetry::gate::v1::RecomputeUsageRequest*,
                                telemetry::gate::v1::RecomputeUsageResponse*) override;

private:
  std::shared_ptr<telemetry::service::DeviceAdminService> service_;
};

}
