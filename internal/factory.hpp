#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/config/runtime_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/alert_sink.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/runtime/background_worker.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace telemetry::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process. Background
  workers are built stopped; the caller starts and stops them around the
  server.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  service::ServiceContext         context;

  std::shared_ptr<notify::Notifier> notifier;

  std::vector<std::unique_ptr<::grpc::Service>>          grpc_services;
  std::vector<std::shared_ptr<runtime::BackgroundWorker>> background_workers;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete DB types and
  the concrete alert sink.
*/
Application Build(const telemetry::runtime::config::RuntimeConfig& config);

// Wiring only: caller supplies storage, clock and sink (tests, tooling).
Application Build(const config::RuntimeOptions& options, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<util::ClockSource> clock, std::shared_ptr<notify::AlertSink> sink);

std::shared_ptr<db::Repository> BuildRepository(const telemetry::runtime::config::DatabaseConfig& database);

} // namespace telemetry::factory
