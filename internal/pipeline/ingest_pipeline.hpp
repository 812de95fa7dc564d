#pragma once

#include <memory>
#include <vector>

#include "gate.hpp"
#include "internal/alert/alert_evaluator.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/store/telemetry_store.hpp"

namespace telemetry::pipeline {

struct IngestResult {
  db::model::SampleRecord sample;

  // alerts handed to the notifier for this sample
  std::size_t alerts_fired = 0;
};

/*
  auth -> rate limit -> quota -> validation -> store -> evaluate -> notify

  The first rejecting gate ends the request with its exception; nothing
  has been written at that point. Once the store commits, the request
  succeeds: evaluation or notification problems are logged, not returned.
*/
class IngestPipeline {
 public:
  IngestPipeline(std::vector<std::unique_ptr<Gate>> gates, std::shared_ptr<store::TelemetryStore> store,
                 std::shared_ptr<alert::AlertEvaluator> evaluator, std::shared_ptr<notify::Notifier> notifier);

  IngestResult Run(IngestContext& ctx);

 private:
  std::vector<std::unique_ptr<Gate>>     gates_;
  std::shared_ptr<store::TelemetryStore> store_;
  std::shared_ptr<alert::AlertEvaluator> evaluator_;
  std::shared_ptr<notify::Notifier>      notifier_;
};

} // namespace telemetry::pipeline
