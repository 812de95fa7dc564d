#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace telemetry::util {

/*
  Crypto helpers backed by OpenSSL libcrypto.
*/

using Sha256Digest = std::array<uint8_t, 32>;

// Cryptographically secure random bytes. Throws on RNG failure.
std::string RandomBytes(std::size_t count);

Sha256Digest Sha256(std::string_view first, std::string_view second = {});

// Compares without early exit; running time depends only on the lengths.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

std::string ToHex(std::string_view bytes);
std::string FromHex(std::string_view hex);

// RFC 4648 section 5 alphabet, no padding.
std::string Base64UrlEncode(std::string_view bytes);

inline std::string_view AsBytes(const Sha256Digest& digest) {
  return {reinterpret_cast<const char*>(digest.data()), digest.size()};
}

} // namespace telemetry::util
