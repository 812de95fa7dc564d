#pragma once

#include <string>
#include <string_view>

namespace telemetry::auth {

struct HashedSecret {
  std::string salt_hex;
  std::string hash_hex;
};

/*
  SHA-256(salt || secret) with a fresh 16-byte salt per credential.
*/
class CredentialHasher {
 public:
  static constexpr std::size_t kSaltBytes   = 16;
  static constexpr std::size_t kSecretBytes = 32;

  // 32 random bytes, URL-safe base64 without padding.
  static std::string GenerateSecret();

  static HashedSecret Hash(std::string_view secret);

  // Same work regardless of outcome.
  static bool Matches(std::string_view secret, const std::string& salt_hex, const std::string& hash_hex);

  // Stands in for a stored credential when the serial is unknown.
  static const HashedSecret& Dummy();
};

} // namespace telemetry::auth
