#include "log_alert_sink.hpp"

#include "internal/observability/logging.hpp"

namespace telemetry::notify {

void LogAlertSink::Send(const AlertMessage& message) {
  TELEMETRY_LOG_INFO("alert notification",
                     {observability::StringField("to", message.recipient), observability::StringField("subject", message.subject)});
}

} // namespace telemetry::notify
