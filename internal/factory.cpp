#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/alert/alert_evaluator.hpp"
#include "internal/alert/cooldown_table.hpp"
#include "internal/auth/credential_verifier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/notify/log_alert_sink.hpp"
#include "internal/notify/smtp_alert_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/gates.hpp"
#include "internal/pipeline/ingest_pipeline.hpp"
#include "internal/quota/quota_enforcer.hpp"
#include "internal/quota/usage_recomputer.hpp"
#include "internal/ratelimit/fixed_window_limiter.hpp"
#include "internal/runtime/periodic_worker.hpp"
#include "internal/service/device_admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/store/telemetry_store.hpp"
#if TELEMETRY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TELEMETRY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace telemetry::factory {

using namespace telemetry;

std::shared_ptr<db::Repository> BuildRepository(const telemetry::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if TELEMETRY_DB_SQLITE
    const auto path = database.sqlite().path().empty() ? std::string("telemetry.db") : database.sqlite().path();
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(path);
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    TELEMETRY_LOG_INFO("Using sqlite repository", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TELEMETRY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgMigrationExecutor migrations(pool);
    db::sql::RunMigrations(migrations, db::sql::PostgresSchema());
    TELEMETRY_LOG_INFO("Using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TELEMETRY_LOG_WARN("Using in-memory repository; data is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const config::RuntimeOptions& options, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<util::ClockSource> clock, std::shared_ptr<notify::AlertSink> sink) {
  Application app;
  app.repository = repository;

  // ------------------------------------------------------------------
  // Gate components
  // ------------------------------------------------------------------
  auto verifier         = std::make_shared<auth::CredentialVerifier>(repository, clock, options.credentials);
  auto ingest_limiter   = std::make_shared<ratelimit::FixedWindowLimiter>(options.ingest_limit, clock);
  auto rotation_limiter = std::make_shared<ratelimit::FixedWindowLimiter>(options.rotation_limit, clock);
  auto quota            = std::make_shared<quota::QuotaEnforcer>(repository, options.ceilings);
  auto recomputer       = std::make_shared<quota::UsageRecomputer>(repository, clock);

  // ------------------------------------------------------------------
  // Store, alerts, delivery
  // ------------------------------------------------------------------
  auto store     = std::make_shared<store::TelemetryStore>(repository, clock);
  auto cooldowns = std::make_shared<alert::CooldownTable>(repository);
  cooldowns->Hydrate();
  auto evaluator = std::make_shared<alert::AlertEvaluator>(repository, cooldowns, clock, options.alert_defaults);
  app.notifier   = std::make_shared<notify::Notifier>(std::move(sink), options.notifier);

  std::vector<std::unique_ptr<pipeline::Gate>> gates;
  gates.push_back(std::make_unique<pipeline::AuthGate>(verifier));
  gates.push_back(std::make_unique<pipeline::RateLimitGate>(ingest_limiter));
  gates.push_back(std::make_unique<pipeline::QuotaGate>(quota));
  gates.push_back(std::make_unique<pipeline::ValidationGate>(pipeline::PayloadValidator(options.validation)));
  auto ingest_pipeline = std::make_shared<pipeline::IngestPipeline>(std::move(gates), store, evaluator, app.notifier);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext& ctx = app.context;
  ctx.repository       = repository;
  ctx.clock            = clock;
  ctx.verifier         = verifier;
  ctx.rotation_limiter = rotation_limiter;
  ctx.quota            = quota;
  ctx.recomputer       = recomputer;
  ctx.store            = store;
  ctx.evaluator        = evaluator;
  ctx.pipeline         = ingest_pipeline;

  auto ingest_service = std::make_shared<service::IngestService>(ctx);
  auto query_service  = std::make_shared<service::QueryService>(ctx);
  auto admin_service  = std::make_shared<service::DeviceAdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::QueryServer>(query_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  app.background_workers.push_back(app.notifier);
  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>("rate_limit_sweep", options.sweep_interval, [ingest_limiter, rotation_limiter] {
    ingest_limiter->Sweep();
    rotation_limiter->Sweep();
  }));
  app.background_workers.push_back(
      std::make_shared<runtime::PeriodicWorker>("usage_recompute", options.recompute_interval,
                                                [recomputer, interval = options.recompute_interval] { recomputer->RecomputeStale(interval); }));

  return app;
}

Application Build(const telemetry::runtime::config::RuntimeConfig& config) {
  const auto options = config::ResolveOptions(config);

  std::shared_ptr<notify::AlertSink> sink;
  if (options.smtp) {
    sink = std::make_shared<notify::SmtpAlertSink>(*options.smtp);
  } else {
    TELEMETRY_LOG_WARN("No SMTP relay configured; alerts are written to the log");
    sink = std::make_shared<notify::LogAlertSink>();
  }

  return Build(options, BuildRepository(config.database()), std::make_shared<util::SystemClock>(), std::move(sink));
}

} // namespace telemetry::factory
