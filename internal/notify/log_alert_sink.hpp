#pragma once

#include "alert_sink.hpp"

namespace telemetry::notify {

// Default sink when no SMTP relay is configured.
class LogAlertSink final : public AlertSink {
 public:
  void Send(const AlertMessage& message) override;

  std::string_view Name() const override {
    return "log";
  }
};

} // namespace telemetry::notify
