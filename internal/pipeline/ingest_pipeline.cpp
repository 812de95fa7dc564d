#include "ingest_pipeline.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace telemetry::pipeline {

IngestPipeline::IngestPipeline(std::vector<std::unique_ptr<Gate>> gates, std::shared_ptr<store::TelemetryStore> store,
                               std::shared_ptr<alert::AlertEvaluator> evaluator, std::shared_ptr<notify::Notifier> notifier)
    : gates_(std::move(gates)), store_(std::move(store)), evaluator_(std::move(evaluator)), notifier_(std::move(notifier)) {
}

IngestResult IngestPipeline::Run(IngestContext& ctx) {
  observability::SpanScope span("IngestPipeline.Run");

  for (const auto& gate : gates_) {
    auto outcome = gate->Evaluate(ctx);
    if (outcome.Admitted()) continue;

    observability::Metrics::Instance().RecordIngestRejection(ToString(outcome.error));
    span.SetAttribute("rejected_by", gate->Name());

    // The presented secret is never logged.
    const auto serial = ctx.device ? ctx.device->serial : std::string("<unauthenticated>");
    if (outcome.error == ErrorClass::kStorage) {
      TELEMETRY_LOG_ERROR("ingest rejected", {observability::StringField("gate", gate->Name()), observability::StringField("serial", serial),
                                              observability::StringField("reason", outcome.reason)});
    } else {
      TELEMETRY_LOG_INFO("ingest rejected", {observability::StringField("gate", gate->Name()), observability::StringField("serial", serial),
                                             observability::StringField("peer", ctx.peer_address),
                                             observability::StringField("reason", outcome.reason)});
    }
    ThrowRejection(outcome);
  }

  if (!ctx.device || !ctx.sample) {
    ThrowRejection(GateOutcome::Reject(ErrorClass::kValidation, "gate chain did not produce a sample"));
  }

  IngestResult result;
  try {
    result.sample = store_->Append(*ctx.sample, ctx.device->owner_id, ctx.DeviceAddress());
  } catch (const std::exception&) {
    observability::Metrics::Instance().RecordIngestRejection(ToString(ErrorClass::kStorage));
    throw;
  }
  span.SetAttribute("sample.id", static_cast<std::int64_t>(result.sample.id));

  try {
    auto fired          = evaluator_->Evaluate(ctx.device->owner_id, ctx.device->name, result.sample);
    result.alerts_fired = fired.size();
    for (auto& alert : fired) notifier_->Notify(std::move(alert));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    TELEMETRY_LOG_ERROR("alert evaluation failed",
                        {observability::StringField("serial", ctx.device->serial), observability::IntField("sample_id", static_cast<int64_t>(result.sample.id)),
                         observability::StringField("error", e.what())});
  }

  return result;
}

} // namespace telemetry::pipeline
