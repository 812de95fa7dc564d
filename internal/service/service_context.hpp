#pragma once

#include <memory>

namespace telemetry::auth { class CredentialVerifier; }
namespace telemetry::ratelimit { class FixedWindowLimiter; }
namespace telemetry::quota { class QuotaEnforcer; class UsageRecomputer; }
namespace telemetry::store { class TelemetryStore; }
namespace telemetry::alert { class AlertEvaluator; }
namespace telemetry::pipeline { class IngestPipeline; }
namespace telemetry::db { class Repository; }
namespace telemetry::util { class ClockSource; }

namespace telemetry::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<telemetry::db::Repository> repository;
  std::shared_ptr<telemetry::util::ClockSource> clock;

  std::shared_ptr<telemetry::auth::CredentialVerifier> verifier;
  std::shared_ptr<telemetry::ratelimit::FixedWindowLimiter> rotation_limiter;
  std::shared_ptr<telemetry::quota::QuotaEnforcer> quota;
  std::shared_ptr<telemetry::quota::UsageRecomputer> recomputer;
  std::shared_ptr<telemetry::store::TelemetryStore> store;
  std::shared_ptr<telemetry::alert::AlertEvaluator> evaluator;
  std::shared_ptr<telemetry::pipeline::IngestPipeline> pipeline;
};

}
