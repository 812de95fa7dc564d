#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace telemetry::auth {

// Identity established by a successful Verify().
struct VerifiedDevice {
  std::string serial;
  std::string owner_id;
  std::string name;
  uint64_t    credential_id = 0;
};

struct IssuedCredential {
  db::model::CredentialRecord record;

  // returned exactly once, never stored
  std::string secret;
};

/*
  Device credential lifecycle: verify, issue (register/rotate), revoke.

  Every failed verification raises the same AuthenticationFailure with the
  same message, and performs one hash + constant-time comparison whether or
  not the serial exists.
*/
class CredentialVerifier {
 public:
  struct Options {
    // zero = credentials never expire
    std::chrono::hours expiry{24 * 365};
  };

  CredentialVerifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock, Options options);

  VerifiedDevice Verify(const std::string& authorization) const;

  // Deactivates whatever is active and inserts a fresh credential, in one transaction.
  IssuedCredential Issue(const std::string& serial);

  // Same as Issue() but inside a caller-owned transaction (device registration).
  IssuedCredential Issue(db::Transaction& tx, const std::string& serial);

  // Idempotent. Returns the number of credentials deactivated.
  uint64_t Revoke(const std::string& serial);

  std::vector<db::model::CredentialRecord> List(const std::string& serial) const;

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<util::ClockSource> clock_;
  Options                            options_;
};

} // namespace telemetry::auth
