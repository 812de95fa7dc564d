#pragma once

#include <string_view>

#include "alert_message.hpp"

namespace telemetry::notify {

/*
  Delivery backend. Send() throws NotificationDispatchFailure; it is called
  from notifier worker threads only and must be thread-safe.
*/
class AlertSink {
 public:
  virtual ~AlertSink() = default;

  virtual void Send(const AlertMessage& message) = 0;

  virtual std::string_view Name() const = 0;
};

} // namespace telemetry::notify
