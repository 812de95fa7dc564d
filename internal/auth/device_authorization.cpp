#include "device_authorization.hpp"

namespace telemetry::auth {

namespace {

constexpr std::string_view kScheme        = "Device ";
constexpr std::size_t      kMaxSerialSize = 64;

std::string_view Trim(std::string_view s) {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto                 begin  = s.find_first_not_of(kSpace);
  if (begin == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(kSpace);
  return s.substr(begin, end - begin + 1);
}

} // namespace

std::optional<DeviceAuthorization> ParseDeviceAuthorization(std::string_view header) {
  if (header.substr(0, kScheme.size()) != kScheme) return std::nullopt;

  const auto rest  = header.substr(kScheme.size());
  const auto colon = rest.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  const auto serial = Trim(rest.substr(0, colon));
  const auto secret = Trim(rest.substr(colon + 1));
  if (serial.empty() || secret.empty() || serial.size() > kMaxSerialSize) return std::nullopt;

  return DeviceAuthorization{std::string(serial), std::string(secret)};
}

std::string FormatDeviceAuthorization(std::string_view serial, std::string_view secret) {
  std::string out(kScheme);
  out.append(serial);
  out.push_back(':');
  out.append(secret);
  return out;
}

} // namespace telemetry::auth
