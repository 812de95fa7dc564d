#include "runtime_options.hpp"

#include <google/protobuf/util/time_util.h>

#include <stdexcept>

namespace telemetry::config {

namespace {

using google::protobuf::util::TimeUtil;

void ResolveWindow(const telemetry::runtime::config::WindowLimit& in, ratelimit::FixedWindowLimiter::Options& out) {
  if (in.capacity() > 0) out.capacity = in.capacity();
  if (in.has_window()) {
    const auto ms = TimeUtil::DurationToMilliseconds(in.window());
    if (ms < 0) throw std::runtime_error("rate limit window must not be negative");
    if (ms > 0) out.window = std::chrono::milliseconds(ms);
  }
}

void ResolveInterval(const google::protobuf::Duration& in, std::chrono::milliseconds& out, const char* name) {
  const auto ms = TimeUtil::DurationToMilliseconds(in);
  if (ms < 0) throw std::runtime_error(std::string(name) + " must not be negative");
  if (ms > 0) out = std::chrono::milliseconds(ms);
}

} // namespace

RuntimeOptions ResolveOptions(const telemetry::runtime::config::RuntimeConfig& config) {
  RuntimeOptions options;

  if (!config.server().bind_address().empty()) options.bind_address = config.server().bind_address();
  if (config.server().max_receive_message_bytes() > 0) {
    options.max_receive_message_bytes = static_cast<int>(config.server().max_receive_message_bytes());
  }

  const auto& limits = config.rate_limits();
  ResolveWindow(limits.ingest(), options.ingest_limit);
  ResolveWindow(limits.rotation(), options.rotation_limit);
  if (limits.has_sweep_interval()) ResolveInterval(limits.sweep_interval(), options.sweep_interval, "sweep_interval");

  const auto& quota = config.quota();
  if (quota.free_limit_bytes() > 0) options.ceilings.free_bytes = quota.free_limit_bytes();
  if (quota.standard_limit_bytes() > 0) options.ceilings.standard_bytes = quota.standard_limit_bytes();
  if (quota.premium_limit_bytes() > 0) options.ceilings.premium_bytes = quota.premium_limit_bytes();
  if (quota.has_recompute_interval()) ResolveInterval(quota.recompute_interval(), options.recompute_interval, "recompute_interval");

  const auto& credentials = config.credentials();
  if (credentials.disable_expiry()) {
    options.credentials.expiry = std::chrono::hours(0);
  } else if (credentials.expiry_days() > 0) {
    options.credentials.expiry = std::chrono::hours(24 * static_cast<int64_t>(credentials.expiry_days()));
  }

  const auto& alerts = config.alerts();
  if (alerts.has_default_high_threshold_c()) options.alert_defaults.high_threshold_c = alerts.default_high_threshold_c();
  if (alerts.has_default_low_threshold_c()) options.alert_defaults.low_threshold_c = alerts.default_low_threshold_c();
  if (alerts.default_cooldown_minutes() > 0) options.alert_defaults.cooldown_minutes = alerts.default_cooldown_minutes();
  if (!(options.alert_defaults.low_threshold_c < options.alert_defaults.high_threshold_c)) {
    throw std::runtime_error("alerts: default low threshold must be below default high threshold");
  }

  const auto& validation = config.validation();
  if (validation.has_setpoint_min_c()) options.validation.setpoint_min_c = validation.setpoint_min_c();
  if (validation.has_setpoint_max_c()) options.validation.setpoint_max_c = validation.setpoint_max_c();
  if (validation.has_hysteresis_min_c()) options.validation.hysteresis_min_c = validation.hysteresis_min_c();
  if (validation.has_hysteresis_max_c()) options.validation.hysteresis_max_c = validation.hysteresis_max_c();
  if (options.validation.setpoint_min_c > options.validation.setpoint_max_c) {
    throw std::runtime_error("validation: setpoint_min_c exceeds setpoint_max_c");
  }
  if (options.validation.hysteresis_min_c > options.validation.hysteresis_max_c) {
    throw std::runtime_error("validation: hysteresis_min_c exceeds hysteresis_max_c");
  }

  const auto& notifier = config.notifier();
  if (notifier.worker_threads() > 0) options.notifier.worker_threads = notifier.worker_threads();
  if (notifier.queue_capacity() > 0) options.notifier.queue_capacity = notifier.queue_capacity();

  if (!notifier.smtp().url().empty()) {
    notify::SmtpAlertSink::Options smtp;
    smtp.url      = notifier.smtp().url();
    smtp.sender   = notifier.smtp().sender();
    smtp.username = notifier.smtp().username();
    smtp.password = notifier.smtp().password();
    if (notifier.smtp().timeout_ms() > 0) smtp.timeout = std::chrono::milliseconds(notifier.smtp().timeout_ms());
    if (smtp.sender.empty()) throw std::runtime_error("notifier.smtp: sender is required when url is set");
    options.smtp = std::move(smtp);
  }

  return options;
}

} // namespace telemetry::config
