#include "admin_server.hpp"
#include "grpc_error.hpp"

namespace telemetry::grpc {

AdminServer::AdminServer(std::shared_ptr<telemetry::service::DeviceAdminService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AdminServer::UpsertAccount(::grpc::ServerContext*,
                                          const telemetry::gate::v1::UpsertAccountRequest* req,
                                          telemetry::gate::v1::UpsertAccountResponse* resp) {
  try {
    *resp = service_->UpsertAccount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RegisterDevice(::grpc::ServerContext*,
                                           const telemetry::gate::v1::RegisterDeviceRequest* req,
                                           telemetry::gate::v1::RegisterDeviceResponse* resp) {
  try {
    *resp = service_->RegisterDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RenameDevice(::grpc::ServerContext*,
                                         const telemetry::gate::v1::RenameDeviceRequest* req,
                                         telemetry::gate::v1::RenameDeviceResponse* resp) {
  try {
    *resp = service_->RenameDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetDevice(::grpc::ServerContext*,
                                      const telemetry::gate::v1::GetDeviceRequest* req,
                                      telemetry::gate::v1::GetDeviceResponse* resp) {
  try {
    *resp = service_->GetDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RotateCredential(::grpc::ServerContext*,
                                             const telemetry::gate::v1::RotateCredentialRequest* req,
                                             telemetry::gate::v1::RotateCredentialResponse* resp) {
  try {
    *resp = service_->RotateCredential(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RevokeCredential(::grpc::ServerContext*,
                                             const telemetry::gate::v1::RevokeCredentialRequest* req,
                                             telemetry::gate::v1::RevokeCredentialResponse* resp) {
  try {
    *resp = service_->RevokeCredential(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListCredentials(::grpc::ServerContext*,
                                            const telemetry::gate::v1::ListCredentialsRequest* req,
                                            telemetry::gate::v1::ListCredentialsResponse* resp) {
  try {
    *resp = service_->ListCredentials(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetAlertSettings(::grpc::ServerContext*,
                                             const telemetry::gate::v1::GetAlertSettingsRequest* req,
                                             telemetry::gate::v1::GetAlertSettingsResponse* resp) {
  try {
    *resp = service_->GetAlertSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpdateAlertSettings(::grpc::ServerContext*,
                                                const telemetry::gate::v1::UpdateAlertSettingsRequest* req,
                                                telemetry::gate::v1::UpdateAlertSettingsResponse* resp) {
  try {
    *resp = service_->UpdateAlertSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetStorageProfile(::grpc::ServerContext*,
                                              const telemetry::gate::v1::GetStorageProfileRequest* req,
                                              telemetry::gate::v1::GetStorageProfileResponse* resp) {
  try {
    *resp = service_->GetStorageProfile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetStoragePlan(::grpc::ServerContext*,
                                           const telemetry::gate::v1::SetStoragePlanRequest* req,
                                           telemetry::gate::v1::SetStoragePlanResponse* resp) {
  try {
    *resp = service_->SetStoragePlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RecomputeUsage(::grpc::ServerContext*,
                                           const telemetry::gate::v1::RecomputeUsageRequest* req,
                                           telemetry::gate::v1::RecomputeUsageResponse* resp) {
  try {
    *resp = service_->RecomputeUsage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
