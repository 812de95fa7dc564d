#include "notifier.hpp"

#include <chrono>

#include "internal/model/telemetry_enums.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace telemetry::notify {

Notifier::Notifier(std::shared_ptr<AlertSink> sink, Options options)
    : sink_(std::move(sink)), options_(options), queue_(std::make_shared<NotificationQueue>(options.queue_capacity)) {
  if (options_.worker_threads == 0) options_.worker_threads = 1;
}

Notifier::~Notifier() {
  Stop();
}

void Notifier::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(options_.worker_threads);
  for (uint32_t i = 0; i < options_.worker_threads; ++i) {
    threads_.emplace_back(&Notifier::Run, this);
  }
}

void Notifier::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void Notifier::Notify(alert::FiredAlert alert) {
  if (alert.recipient.empty()) {
    Fail(alert, "no_recipient", "alert has no resolvable recipient");
    return;
  }

  if (!queue_->TryEnqueue(alert)) {
    Fail(alert, "queue_full", "notification queue full or stopped");
  }
}

void Notifier::Fail(const alert::FiredAlert& alert, std::string_view reason, std::string_view detail) {
  ++failed_;
  observability::Metrics::Instance().RecordNotificationFailure(reason);

  TELEMETRY_LOG_ERROR("alert notification failed", {observability::StringField("serial", alert.serial),
                                                    observability::StringField("direction", model::ToString(alert.direction)),
                                                    observability::StringField("reason", reason),
                                                    observability::StringField("error", detail)});
}

void Notifier::Run() {
  while (auto alert = queue_->Dequeue()) {
    const auto started_at = std::chrono::steady_clock::now();
    try {
      sink_->Send(ComposeMessage(*alert));
      ++delivered_;
    } catch (const std::exception& e) {
      Fail(*alert, "sink_error", e.what());
    }
    observability::Metrics::Instance().ObserveNotificationDurationMs(
        sink_->Name(), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  }
}

} // namespace telemetry::notify
