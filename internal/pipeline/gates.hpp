#pragma once

#include <memory>

#include "gate.hpp"
#include "internal/auth/credential_verifier.hpp"
#include "internal/quota/quota_enforcer.hpp"
#include "internal/ratelimit/fixed_window_limiter.hpp"
#include "payload_validator.hpp"

namespace telemetry::pipeline {

// Resolves the device identity; every later gate relies on ctx.device.
class AuthGate final : public Gate {
 public:
  explicit AuthGate(std::shared_ptr<auth::CredentialVerifier> verifier);

  std::string_view Name() const override {
    return "auth";
  }
  GateOutcome Evaluate(IngestContext& ctx) override;

 private:
  std::shared_ptr<auth::CredentialVerifier> verifier_;
};

// Counts the attempt against the device's window.
class RateLimitGate final : public Gate {
 public:
  explicit RateLimitGate(std::shared_ptr<ratelimit::FixedWindowLimiter> limiter);

  std::string_view Name() const override {
    return "rate_limit";
  }
  GateOutcome Evaluate(IngestContext& ctx) override;

 private:
  std::shared_ptr<ratelimit::FixedWindowLimiter> limiter_;
};

class QuotaGate final : public Gate {
 public:
  explicit QuotaGate(std::shared_ptr<quota::QuotaEnforcer> enforcer);

  std::string_view Name() const override {
    return "quota";
  }
  GateOutcome Evaluate(IngestContext& ctx) override;

 private:
  std::shared_ptr<quota::QuotaEnforcer> enforcer_;
};

class ValidationGate final : public Gate {
 public:
  explicit ValidationGate(PayloadValidator validator);

  std::string_view Name() const override {
    return "validation";
  }
  GateOutcome Evaluate(IngestContext& ctx) override;

 private:
  PayloadValidator validator_;
};

} // namespace telemetry::pipeline
