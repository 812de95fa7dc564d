#include "alert_message.hpp"

#include <cstdio>
#include <sstream>

#include "internal/util/time.hpp"

namespace telemetry::notify {

namespace {

std::string Celsius(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f C", value);
  return buffer;
}

} // namespace

AlertMessage ComposeMessage(const alert::FiredAlert& alert) {
  const bool  high    = alert.direction == telemetry::gate::core::v1::ALERT_DIRECTION_HIGH;
  const auto& display = alert.device_name.empty() ? alert.serial : alert.device_name;

  AlertMessage message;
  message.recipient = alert.recipient;
  message.subject   = std::string(high ? "High" : "Low") + " Temperature Alert - " + display;

  std::ostringstream body;
  body << "The inside temperature of " << display << " is " << (high ? "above" : "below") << " its configured threshold.\n"
       << "\n"
       << "Device:       " << display << "\n"
       << "Serial:       " << alert.serial << "\n"
       << "Temperature:  " << Celsius(alert.temp_inside_c) << "\n"
       << "Threshold:    " << Celsius(alert.threshold_c) << "\n"
       << "Received at:  " << util::FormatRfc3339(util::FromUnixMillis(alert.received_at_ms)) << "\n"
       << "\n"
       << "Telemetry Gate Alert System\n";
  message.body = body.str();
  return message;
}

} // namespace telemetry::notify
