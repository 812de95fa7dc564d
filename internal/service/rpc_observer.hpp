#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::service {

// Rejections a caller can fix or retry; logged at info, not error.
inline bool IsClientError(const std::exception& ex) {
  using namespace telemetry::util;
  return dynamic_cast<const AuthenticationFailure*>(&ex) || dynamic_cast<const RateLimitExceeded*>(&ex) ||
         dynamic_cast<const QuotaExceeded*>(&ex) || dynamic_cast<const ValidationFailure*>(&ex) || dynamic_cast<const NotFound*>(&ex) ||
         dynamic_cast<const AlreadyExists*>(&ex);
}

/*
  Span + request metrics + failure log around one RPC body.
  `subject` is the serial or owner the call is about (may be empty).
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  telemetry::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    telemetry::observability::Metrics::Instance().RecordRequest(route, success);
    telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    if (IsClientError(ex)) {
      TELEMETRY_LOG_INFO("RPC rejected", {telemetry::observability::StringField("route", route),
                                          telemetry::observability::StringField("subject", subject),
                                          telemetry::observability::StringField("error", ex.what())});
    } else {
      TELEMETRY_LOG_ERROR("RPC failed", {telemetry::observability::StringField("route", route),
                                         telemetry::observability::StringField("subject", subject),
                                         telemetry::observability::StringField("error", ex.what())});
    }
    finish(false);
    throw;
  }
}

} // namespace telemetry::service
