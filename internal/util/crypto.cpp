#include "crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace telemetry::util {
namespace {

std::string LastOpensslError(const char* what) {
  char buffer[256] = {0};
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return std::string(what) + ": " + buffer;
}

} // namespace

std::string RandomBytes(std::size_t count) {
  std::string out(count, '\0');
  if (count == 0) return out;

  if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
    throw std::runtime_error(LastOpensslError("RAND_bytes"));
  }
  return out;
}

Sha256Digest Sha256(std::string_view first, std::string_view second) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error(LastOpensslError("EVP_MD_CTX_new"));
  }

  Sha256Digest digest{};
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), first.data(), first.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), second.data(), second.size()) != 1 || EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    throw std::runtime_error(LastOpensslError("sha256"));
  }
  return digest;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string ToHex(std::string_view bytes) {
  if (bytes.empty()) return {};

  // room for the NUL OpenSSL always writes
  std::string out(bytes.size() * 2 + 1, '\0');
  std::size_t written = 0;
  if (OPENSSL_buf2hexstr_ex(out.data(), out.size(), &written, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), '\0') != 1) {
    throw std::runtime_error(LastOpensslError("OPENSSL_buf2hexstr_ex"));
  }
  out.resize(bytes.size() * 2);

  // OpenSSL emits upper case; stored hashes are lower case.
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex string has odd length");
  }
  if (hex.empty()) return {};

  const std::string terminated(hex);
  std::string       out(hex.size() / 2, '\0');
  std::size_t       len = 0;
  if (OPENSSL_hexstr2buf_ex(reinterpret_cast<unsigned char*>(out.data()), out.size(), &len, terminated.c_str(), '\0') != 1) {
    ERR_clear_error();
    throw std::invalid_argument("invalid hex digit");
  }
  out.resize(len);
  return out;
}

std::string Base64UrlEncode(std::string_view bytes) {
  if (bytes.empty()) return {};

  // 4 output chars per 3 input bytes plus the NUL
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int   len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(bytes.data()),
                                    static_cast<int>(bytes.size()));
  if (len < 0) {
    throw std::runtime_error(LastOpensslError("EVP_EncodeBlock"));
  }
  out.resize(static_cast<std::size_t>(len));

  // standard alphabet to the URL-safe one, padding dropped
  for (auto& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

} // namespace telemetry::util
