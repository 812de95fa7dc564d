#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace telemetry::auth {

struct DeviceAuthorization {
  std::string serial;
  std::string secret;
};

/*
  Parses "Device <serial>:<secret>".

  The prefix is case-sensitive and must be followed by a single space. The
  rest is split on the first ':'; both halves are trimmed and must be
  non-empty. Serials are at most 64 characters.
*/
std::optional<DeviceAuthorization> ParseDeviceAuthorization(std::string_view header);

std::string FormatDeviceAuthorization(std::string_view serial, std::string_view secret);

} // namespace telemetry::auth
