#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/alert/alert_evaluator.hpp"
#include "internal/auth/credential_verifier.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/notify/smtp_alert_sink.hpp"
#include "internal/pipeline/payload_validator.hpp"
#include "internal/quota/plan_ceilings.hpp"
#include "internal/ratelimit/fixed_window_limiter.hpp"

namespace telemetry::config {

/*
  RuntimeConfig with every default applied, in the option types the
  components take. Zero or absent config values mean "default".
*/
struct RuntimeOptions {
  std::string bind_address              = "0.0.0.0:50051";
  int         max_receive_message_bytes = 4 * 1024 * 1024;

  ratelimit::FixedWindowLimiter::Options ingest_limit{60, std::chrono::seconds(60)};
  ratelimit::FixedWindowLimiter::Options rotation_limit{5, std::chrono::hours(1)};
  std::chrono::milliseconds              sweep_interval{std::chrono::seconds(60)};

  quota::PlanCeilings       ceilings;
  std::chrono::milliseconds recompute_interval{std::chrono::hours(1)};

  auth::CredentialVerifier::Options credentials;
  alert::AlertDefaults              alert_defaults;
  pipeline::ValidationRanges        validation;

  notify::Notifier::Options notifier;
  // unset = alerts go to the log sink
  std::optional<notify::SmtpAlertSink::Options> smtp;
};

// Throws std::runtime_error on values no default can repair (inverted ranges).
RuntimeOptions ResolveOptions(const telemetry::runtime::config::RuntimeConfig& config);

} // namespace telemetry::config
