#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ingest_context.hpp"

namespace telemetry::pipeline {

enum class ErrorClass : std::uint8_t {
  kNone = 0,
  kAuthentication,
  kRateLimit,
  kQuota,
  kValidation,
  kStorage,
};

constexpr std::string_view ToString(ErrorClass c) {
  switch (c) {
    case ErrorClass::kAuthentication:
      return "authentication";
    case ErrorClass::kRateLimit:
      return "rate_limit";
    case ErrorClass::kQuota:
      return "quota";
    case ErrorClass::kValidation:
      return "validation";
    case ErrorClass::kStorage:
      return "storage";
    case ErrorClass::kNone:
    default:
      return "none";
  }
}

struct GateOutcome {
  ErrorClass  error = ErrorClass::kNone;
  std::string reason;

  static GateOutcome Admit() {
    return {};
  }

  static GateOutcome Reject(ErrorClass c, std::string why) {
    return {c, std::move(why)};
  }

  bool Admitted() const {
    return error == ErrorClass::kNone;
  }
};

/*
  One admission check. Gates run in order before anything is persisted;
  a gate may only mutate in-memory state (the limiter counters) and the
  context.
*/
class Gate {
 public:
  virtual ~Gate() = default;

  virtual std::string_view Name() const = 0;

  virtual GateOutcome Evaluate(IngestContext& ctx) = 0;
};

// Throws the util:: exception matching the rejection class.
[[noreturn]] void ThrowRejection(const GateOutcome& outcome);

} // namespace telemetry::pipeline
