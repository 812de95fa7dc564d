#include "credential_hasher.hpp"

#include "internal/util/crypto.hpp"

namespace telemetry::auth {

std::string CredentialHasher::GenerateSecret() {
  return util::Base64UrlEncode(util::RandomBytes(kSecretBytes));
}

HashedSecret CredentialHasher::Hash(std::string_view secret) {
  const auto salt = util::RandomBytes(kSaltBytes);
  return {util::ToHex(salt), util::ToHex(util::AsBytes(util::Sha256(salt, secret)))};
}

bool CredentialHasher::Matches(std::string_view secret, const std::string& salt_hex, const std::string& hash_hex) {
  const auto salt     = util::FromHex(salt_hex);
  const auto computed = util::ToHex(util::AsBytes(util::Sha256(salt, secret)));
  return util::ConstantTimeEquals(computed, hash_hex);
}

const HashedSecret& CredentialHasher::Dummy() {
  // Random per process; nothing can ever match it.
  static const HashedSecret dummy = Hash(util::Base64UrlEncode(util::RandomBytes(kSecretBytes)));
  return dummy;
}

} // namespace telemetry::auth
