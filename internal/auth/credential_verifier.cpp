#include "credential_verifier.hpp"

#include <optional>

#include "credential_hasher.hpp"
#include "device_authorization.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::auth {

namespace {

constexpr const char* kInvalidCredentials = "invalid device credentials";

void ThrowIfFailed(const db::Result& r, const std::string& what) {
  if (r) return;
  if (r.code == db::ErrorCode::NotFound) throw util::NotFound(what + ": " + r.message);
  throw util::StorageUnavailable(what + ": " + r.message);
}

} // namespace

CredentialVerifier::CredentialVerifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock, Options options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
}

VerifiedDevice CredentialVerifier::Verify(const std::string& authorization) const {
  const auto parsed = ParseDeviceAuthorization(authorization);
  if (!parsed) throw util::AuthenticationFailure(kInvalidCredentials);

  // Known and unknown serials cost the same: one joined lookup, one hash.
  std::optional<db::model::ActiveCredential> found;
  try {
    auto tx = repository_->Begin();
    found   = repository_->GetActiveCredentialWithDevice(*tx, parsed->serial);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(std::string("credential lookup failed: ") + e.what());
  }

  const auto& dummy   = CredentialHasher::Dummy();
  const auto& salt    = found ? found->credential.salt_hex : dummy.salt_hex;
  const auto& hash    = found ? found->credential.hash_hex : dummy.hash_hex;
  const bool  matches = CredentialHasher::Matches(parsed->secret, salt, hash);
  const auto  now_ms  = util::ToUnixMillis(clock_->Now());
  const auto  expires = found ? found->credential.expires_at_ms : 0;
  const bool  expired = expires != 0 && now_ms >= expires;

  if (!found || !matches || expired) throw util::AuthenticationFailure(kInvalidCredentials);

  return VerifiedDevice{found->device.serial, found->device.owner_id, found->device.name, found->credential.id};
}

IssuedCredential CredentialVerifier::Issue(const std::string& serial) {
  auto tx     = repository_->Begin();
  auto issued = Issue(*tx, serial);
  tx->Commit();
  return issued;
}

IssuedCredential CredentialVerifier::Issue(db::Transaction& tx, const std::string& serial) {
  if (!repository_->GetDevice(tx, serial)) throw util::NotFound("device not found: " + serial);

  uint64_t deactivated = 0;
  ThrowIfFailed(repository_->DeactivateCredentials(tx, serial, deactivated), "deactivate credentials");

  IssuedCredential issued;
  issued.secret = CredentialHasher::GenerateSecret();

  const auto hashed = CredentialHasher::Hash(issued.secret);
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  auto&      record = issued.record;

  record.serial        = serial;
  record.salt_hex      = hashed.salt_hex;
  record.hash_hex      = hashed.hash_hex;
  record.created_at_ms = now_ms;
  record.expires_at_ms =
      options_.expiry.count() > 0 ? now_ms + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.expiry).count()) : 0;
  record.active = true;

  ThrowIfFailed(repository_->InsertCredential(tx, record), "insert credential");
  return issued;
}

uint64_t CredentialVerifier::Revoke(const std::string& serial) {
  auto tx = repository_->Begin();
  if (!repository_->GetDevice(*tx, serial)) throw util::NotFound("device not found: " + serial);

  uint64_t deactivated = 0;
  ThrowIfFailed(repository_->DeactivateCredentials(*tx, serial, deactivated), "deactivate credentials");
  tx->Commit();
  return deactivated;
}

std::vector<db::model::CredentialRecord> CredentialVerifier::List(const std::string& serial) const {
  auto tx = repository_->Begin();
  if (!repository_->GetDevice(*tx, serial)) throw util::NotFound("device not found: " + serial);

  auto records = repository_->ListCredentials(*tx, serial);
  tx->Commit();
  for (auto& r : records) {
    r.salt_hex.clear();
    r.hash_hex.clear();
  }
  return records;
}

} // namespace telemetry::auth
