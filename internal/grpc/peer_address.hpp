#pragma once

#include <string>
#include <string_view>

namespace grpc {
class ServerContext;
}

namespace telemetry::grpc {

// "ipv4:10.0.0.7:5000" -> "10.0.0.7", "ipv6:[::1]:5000" -> "::1".
// Anything unrecognised (unix sockets, in-process) becomes "".
std::string NormalizePeer(std::string_view peer);

/*
  Address of the calling device: first entry of x-forwarded-for when the
  HTTP proxy supplied one, otherwise the transport peer.
*/
std::string DeviceAddress(const ::grpc::ServerContext& context);

// Value of a client metadata key, "" when absent.
std::string ClientMetadata(const ::grpc::ServerContext& context, std::string_view key);

} // namespace telemetry::grpc
