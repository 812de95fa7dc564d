#include "device_admin_service.hpp"

#include <cctype>
#include <cmath>

#include "internal/alert/alert_evaluator.hpp"
#include "internal/auth/credential_verifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/quota/quota_enforcer.hpp"
#include "internal/quota/usage_recomputer.hpp"
#include "internal/ratelimit/fixed_window_limiter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace telemetry::service {

using namespace telemetry::gate::services::v1;
using telemetry::gate::core::v1::StoragePlan;

namespace {

constexpr std::size_t kMaxSerialSize = 64;
constexpr std::size_t kMaxNameSize   = 128;

constexpr double   kThresholdMinC   = -40.0;
constexpr double   kThresholdMaxC   = 85.0;
constexpr uint32_t kCooldownMinMins = 1;
constexpr uint32_t kCooldownMaxMins = 1440;

void ThrowIfFailed(const db::Result& r, const std::string& what) {
  if (r) return;
  switch (r.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(what + ": not found");
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(what + ": already exists");
    default:
      throw util::StorageUnavailable(what + ": " + db::ToString(r.code) + (r.message.empty() ? "" : " " + r.message));
  }
}

// local@domain.tld, no whitespace
bool LooksLikeEmail(const std::string& s) {
  const auto at = s.find('@');
  if (at == std::string::npos || at == 0 || s.find('@', at + 1) != std::string::npos) return false;
  const auto dot = s.find('.', at + 2);
  if (dot == std::string::npos || dot + 1 >= s.size()) return false;
  for (char c : s) {
    if (c <= ' ' || c == '<' || c == '>' || c == ',') return false;
  }
  return true;
}

// Printable ASCII without ':' so it can sit in the authorization header.
void ValidateSerial(const std::string& serial) {
  if (serial.empty() || serial.size() > kMaxSerialSize) {
    throw util::ValidationFailure("serial must be 1 to " + std::to_string(kMaxSerialSize) + " characters");
  }
  for (char c : serial) {
    if (c <= ' ' || c > '~' || c == ':') throw util::ValidationFailure("serial contains an invalid character");
  }
}

// Names end up in alert mail headers, so no control characters.
void ValidateName(const std::string& name) {
  if (name.size() > kMaxNameSize) throw util::ValidationFailure("name longer than " + std::to_string(kMaxNameSize) + " characters");
  for (char c : name) {
    if (std::iscntrl(static_cast<unsigned char>(c))) throw util::ValidationFailure("name contains a control character");
  }
}

void ValidateAlertSettings(const db::model::AlertSettingsRecord& s) {
  const auto in_range = [](double v) { return std::isfinite(v) && v >= kThresholdMinC && v <= kThresholdMaxC; };
  if (!in_range(s.high_threshold_c)) throw util::ValidationFailure("high threshold must be between -40 and 85");
  if (!in_range(s.low_threshold_c)) throw util::ValidationFailure("low threshold must be between -40 and 85");
  if (s.high_enabled && s.low_enabled && !(s.low_threshold_c < s.high_threshold_c)) {
    throw util::ValidationFailure("low threshold must be below high threshold");
  }
  if (s.cooldown_minutes < kCooldownMinMins || s.cooldown_minutes > kCooldownMaxMins) {
    throw util::ValidationFailure("cooldown must be between 1 and 1440 minutes");
  }
  if (!s.recipient.empty() && !LooksLikeEmail(s.recipient)) {
    throw util::ValidationFailure("recipient is not a valid email address");
  }
}

db::model::DeviceRecord RequireDevice(db::Repository& repo, db::Transaction& tx, const std::string& serial) {
  auto device = repo.GetDevice(tx, serial);
  if (!device) throw util::NotFound("device not found: " + serial);
  return *device;
}

} // namespace

DeviceAdminService::DeviceAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

UpsertAccountResponse DeviceAdminService::UpsertAccount(const UpsertAccountRequest& req) {
  return ObserveRpc("DeviceAdminService.UpsertAccount", req.account().id(), [&] {
    const auto& account = req.account();
    if (account.id().empty()) throw util::ValidationFailure("account id is required");
    if (!account.email().empty() && !LooksLikeEmail(account.email())) throw util::ValidationFailure("email is not a valid address");

    auto tx = ctx_.repository->Begin();
    ThrowIfFailed(ctx_.repository->UpsertAccount(*tx, {account.id(), account.email()}), "upsert account");
    tx->Commit();

    UpsertAccountResponse resp;
    *resp.mutable_account() = account;
    return resp;
  });
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

RegisterDeviceResponse DeviceAdminService::RegisterDevice(const RegisterDeviceRequest& req) {
  return ObserveRpc("DeviceAdminService.RegisterDevice", req.serial(), [&] {
    ValidateSerial(req.serial());
    ValidateName(req.name());
    if (req.owner_id().empty()) throw util::ValidationFailure("owner_id is required");

    auto tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetAccount(*tx, req.owner_id())) throw util::NotFound("account not found: " + req.owner_id());

    db::model::DeviceRecord device;
    device.serial        = req.serial();
    device.owner_id      = req.owner_id();
    device.name          = req.name();
    device.created_at_ms = util::ToUnixMillis(ctx_.clock->Now());
    ThrowIfFailed(ctx_.repository->InsertDevice(*tx, device), "device " + req.serial());

    ThrowIfFailed(ctx_.repository->UpsertAlertSettings(*tx, ctx_.evaluator->defaults().For(req.serial())), "alert settings");

    // adding nothing creates the FREE profile if the owner has none
    ThrowIfFailed(ctx_.repository->AddStorageUsage(*tx, req.owner_id(), 0), "storage profile");

    auto issued = ctx_.verifier->Issue(*tx, req.serial());
    tx->Commit();

    TELEMETRY_LOG_INFO("device registered",
                       {observability::StringField("serial", device.serial), observability::StringField("owner", device.owner_id)});

    RegisterDeviceResponse resp;
    *resp.mutable_device()     = ToProto(device);
    *resp.mutable_credential() = ToProto(issued.record);
    resp.set_secret(issued.secret);
    return resp;
  });
}

RenameDeviceResponse DeviceAdminService::RenameDevice(const RenameDeviceRequest& req) {
  return ObserveRpc("DeviceAdminService.RenameDevice", req.serial(), [&] {
    ValidateName(req.name());

    auto tx = ctx_.repository->Begin();
    ThrowIfFailed(ctx_.repository->RenameDevice(*tx, req.serial(), req.name()), "device " + req.serial());
    auto device = RequireDevice(*ctx_.repository, *tx, req.serial());
    tx->Commit();

    RenameDeviceResponse resp;
    *resp.mutable_device() = ToProto(device);
    return resp;
  });
}

GetDeviceResponse DeviceAdminService::GetDevice(const GetDeviceRequest& req) {
  return ObserveRpc("DeviceAdminService.GetDevice", req.serial(), [&] {
    auto tx     = ctx_.repository->Begin();
    auto device = RequireDevice(*ctx_.repository, *tx, req.serial());
    tx->Commit();

    GetDeviceResponse resp;
    *resp.mutable_device() = ToProto(device);
    return resp;
  });
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

RotateCredentialResponse DeviceAdminService::RotateCredential(const RotateCredentialRequest& req) {
  return ObserveRpc("DeviceAdminService.RotateCredential", req.serial(), [&] {
    if (!ctx_.rotation_limiter->TryAcquire(req.serial())) {
      throw util::RateLimitExceeded("credential rotation limit reached for " + req.serial());
    }

    auto issued = ctx_.verifier->Issue(req.serial());
    TELEMETRY_LOG_INFO("credential rotated",
                       {observability::StringField("serial", req.serial()), observability::IntField("credential_id", static_cast<int64_t>(issued.record.id))});

    RotateCredentialResponse resp;
    *resp.mutable_credential() = ToProto(issued.record);
    resp.set_secret(issued.secret);
    return resp;
  });
}

RevokeCredentialResponse DeviceAdminService::RevokeCredential(const RevokeCredentialRequest& req) {
  return ObserveRpc("DeviceAdminService.RevokeCredential", req.serial(), [&] {
    const auto revoked = ctx_.verifier->Revoke(req.serial());

    RevokeCredentialResponse resp;
    resp.set_revoked_count(static_cast<uint32_t>(revoked));
    return resp;
  });
}

ListCredentialsResponse DeviceAdminService::ListCredentials(const ListCredentialsRequest& req) {
  return ObserveRpc("DeviceAdminService.ListCredentials", req.serial(), [&] {
    ListCredentialsResponse resp;
    for (const auto& record : ctx_.verifier->List(req.serial())) {
      *resp.add_credentials() = ToProto(record);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Alert settings
// ------------------------------------------------------------------

GetAlertSettingsResponse DeviceAdminService::GetAlertSettings(const GetAlertSettingsRequest& req) {
  return ObserveRpc("DeviceAdminService.GetAlertSettings", req.serial(), [&] {
    auto tx = ctx_.repository->Begin();
    RequireDevice(*ctx_.repository, *tx, req.serial());
    auto settings = ctx_.repository->GetAlertSettings(*tx, req.serial());
    tx->Commit();

    GetAlertSettingsResponse resp;
    *resp.mutable_settings() = ToProto(settings ? *settings : ctx_.evaluator->defaults().For(req.serial()));
    return resp;
  });
}

UpdateAlertSettingsResponse DeviceAdminService::UpdateAlertSettings(const UpdateAlertSettingsRequest& req) {
  return ObserveRpc("DeviceAdminService.UpdateAlertSettings", req.settings().serial(), [&] {
    const auto settings = FromProto(req.settings());
    ValidateAlertSettings(settings);

    auto tx = ctx_.repository->Begin();
    RequireDevice(*ctx_.repository, *tx, settings.serial);
    ThrowIfFailed(ctx_.repository->UpsertAlertSettings(*tx, settings), "alert settings");
    tx->Commit();

    UpdateAlertSettingsResponse resp;
    *resp.mutable_settings() = ToProto(settings);
    return resp;
  });
}

// ------------------------------------------------------------------
// Storage profiles
// ------------------------------------------------------------------

GetStorageProfileResponse DeviceAdminService::GetStorageProfile(const GetStorageProfileRequest& req) {
  return ObserveRpc("DeviceAdminService.GetStorageProfile", req.owner_id(), [&] {
    auto tx      = ctx_.repository->Begin();
    auto profile = ctx_.repository->GetStorageProfile(*tx, req.owner_id());
    if (!profile && !ctx_.repository->GetAccount(*tx, req.owner_id())) throw util::NotFound("account not found: " + req.owner_id());
    tx->Commit();

    if (!profile) {
      profile           = db::model::StorageProfileRecord{};
      profile->owner_id = req.owner_id();
    }

    GetStorageProfileResponse resp;
    *resp.mutable_profile() = ToProto(*profile, ctx_.quota->ceilings());
    return resp;
  });
}

SetStoragePlanResponse DeviceAdminService::SetStoragePlan(const SetStoragePlanRequest& req) {
  return ObserveRpc("DeviceAdminService.SetStoragePlan", req.owner_id(), [&] {
    if (req.plan() == telemetry::gate::core::v1::STORAGE_PLAN_UNSPECIFIED || !telemetry::gate::core::v1::StoragePlan_IsValid(req.plan())) {
      throw util::ValidationFailure("plan must be FREE, STANDARD or PREMIUM");
    }

    // Plan column only; usage keeps whatever ingest or a recompute wrote.
    auto tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetAccount(*tx, req.owner_id())) throw util::NotFound("account not found: " + req.owner_id());
    ThrowIfFailed(ctx_.repository->SetStoragePlan(*tx, req.owner_id(), req.plan()), "storage profile");
    auto profile = ctx_.repository->GetStorageProfile(*tx, req.owner_id());
    tx->Commit();
    if (!profile) throw util::StorageUnavailable("storage profile missing after plan change: " + req.owner_id());

    SetStoragePlanResponse resp;
    *resp.mutable_profile() = ToProto(*profile, ctx_.quota->ceilings());
    return resp;
  });
}

RecomputeUsageResponse DeviceAdminService::RecomputeUsage(const RecomputeUsageRequest& req) {
  return ObserveRpc("DeviceAdminService.RecomputeUsage", req.owner_id(), [&] {
    std::vector<db::model::StorageProfileRecord> profiles;
    if (req.owner_id().empty()) {
      profiles = ctx_.recomputer->RecomputeAll();
    } else {
      {
        auto tx = ctx_.repository->Begin();
        if (!ctx_.repository->GetAccount(*tx, req.owner_id())) throw util::NotFound("account not found: " + req.owner_id());
        tx->Commit();
      }
      profiles.push_back(ctx_.recomputer->RecomputeOwner(req.owner_id()));
    }

    RecomputeUsageResponse resp;
    for (const auto& profile : profiles) {
      *resp.add_profiles() = ToProto(profile, ctx_.quota->ceilings());
    }
    return resp;
  });
}

} // namespace telemetry::service
