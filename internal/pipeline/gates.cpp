#include "gates.hpp"

#include "internal/util/errors.hpp"

namespace telemetry::pipeline {

void ThrowRejection(const GateOutcome& outcome) {
  switch (outcome.error) {
    case ErrorClass::kAuthentication:
      throw util::AuthenticationFailure(outcome.reason);
    case ErrorClass::kRateLimit:
      throw util::RateLimitExceeded(outcome.reason);
    case ErrorClass::kQuota:
      throw util::QuotaExceeded(outcome.reason);
    case ErrorClass::kValidation:
      throw util::ValidationFailure(outcome.reason);
    case ErrorClass::kStorage:
    case ErrorClass::kNone:
    default:
      throw util::StorageUnavailable(outcome.reason);
  }
}

namespace {

GateOutcome MissingDevice() {
  return GateOutcome::Reject(ErrorClass::kAuthentication, "invalid device credentials");
}

} // namespace

// ------------------------------------------------------------------
// Auth
// ------------------------------------------------------------------

AuthGate::AuthGate(std::shared_ptr<auth::CredentialVerifier> verifier) : verifier_(std::move(verifier)) {
}

GateOutcome AuthGate::Evaluate(IngestContext& ctx) {
  try {
    ctx.device = verifier_->Verify(ctx.authorization);
    return GateOutcome::Admit();
  } catch (const util::AuthenticationFailure& e) {
    return GateOutcome::Reject(ErrorClass::kAuthentication, e.what());
  } catch (const util::StorageUnavailable& e) {
    return GateOutcome::Reject(ErrorClass::kStorage, e.what());
  }
}

// ------------------------------------------------------------------
// Rate limit
// ------------------------------------------------------------------

RateLimitGate::RateLimitGate(std::shared_ptr<ratelimit::FixedWindowLimiter> limiter) : limiter_(std::move(limiter)) {
}

GateOutcome RateLimitGate::Evaluate(IngestContext& ctx) {
  if (!ctx.device) return MissingDevice();

  if (!limiter_->TryAcquire(ctx.device->serial)) {
    return GateOutcome::Reject(ErrorClass::kRateLimit, "rate limit exceeded: at most " + std::to_string(limiter_->options().capacity) +
                                                           " requests per " + std::to_string(limiter_->options().window.count() / 1000) + "s");
  }
  return GateOutcome::Admit();
}

// ------------------------------------------------------------------
// Quota
// ------------------------------------------------------------------

QuotaGate::QuotaGate(std::shared_ptr<quota::QuotaEnforcer> enforcer) : enforcer_(std::move(enforcer)) {
}

GateOutcome QuotaGate::Evaluate(IngestContext& ctx) {
  if (!ctx.device) return MissingDevice();

  try {
    enforcer_->Check(ctx.device->owner_id);
    return GateOutcome::Admit();
  } catch (const util::QuotaExceeded& e) {
    return GateOutcome::Reject(ErrorClass::kQuota, e.what());
  } catch (const util::StorageUnavailable& e) {
    return GateOutcome::Reject(ErrorClass::kStorage, e.what());
  }
}

// ------------------------------------------------------------------
// Validation
// ------------------------------------------------------------------

ValidationGate::ValidationGate(PayloadValidator validator) : validator_(std::move(validator)) {
}

GateOutcome ValidationGate::Evaluate(IngestContext& ctx) {
  if (!ctx.device) return MissingDevice();
  if (!ctx.parse_error.empty()) return GateOutcome::Reject(ErrorClass::kValidation, ctx.parse_error);

  try {
    ctx.sample = validator_.Validate(ctx.body, ctx.device->serial, ctx.raw_payload);
    return GateOutcome::Admit();
  } catch (const util::ValidationFailure& e) {
    return GateOutcome::Reject(ErrorClass::kValidation, e.what());
  }
}

} // namespace telemetry::pipeline
