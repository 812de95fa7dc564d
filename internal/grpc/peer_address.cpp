#include "peer_address.hpp"

#include <grpcpp/grpcpp.h>

namespace telemetry::grpc {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Strips "%5B" / "%5D" escaping some gRPC versions apply to v6 brackets.
std::string Unescape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s.substr(i, 3) == "%5B" || s.substr(i, 3) == "%5b") {
      out.push_back('[');
      i += 2;
    } else if (s.substr(i, 3) == "%5D" || s.substr(i, 3) == "%5d") {
      out.push_back(']');
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

} // namespace

std::string NormalizePeer(std::string_view peer) {
  if (peer.rfind("ipv4:", 0) == 0) {
    auto host = peer.substr(5);
    const auto colon = host.rfind(':');
    return std::string(colon == std::string_view::npos ? host : host.substr(0, colon));
  }

  if (peer.rfind("ipv6:", 0) == 0) {
    const auto host = Unescape(peer.substr(5));
    if (!host.empty() && host.front() == '[') {
      const auto close = host.find(']');
      if (close != std::string::npos) return host.substr(1, close - 1);
    }
    return host;
  }

  return {};
}

std::string ClientMetadata(const ::grpc::ServerContext& context, std::string_view key) {
  const auto& metadata = context.client_metadata();
  auto it = metadata.find(::grpc::string_ref(key.data(), key.size()));
  if (it == metadata.end()) return {};
  return std::string(it->second.data(), it->second.size());
}

std::string DeviceAddress(const ::grpc::ServerContext& context) {
  const auto forwarded = ClientMetadata(context, "x-forwarded-for");
  if (!forwarded.empty()) {
    const auto first = Trim(std::string_view(forwarded).substr(0, forwarded.find(',')));
    if (!first.empty()) return std::string(first);
  }
  return NormalizePeer(context.peer());
}

} // namespace telemetry::grpc
