#pragma once

#include <string>

#include "internal/alert/fired_alert.hpp"

namespace telemetry::notify {

struct AlertMessage {
  std::string recipient;
  std::string subject;
  std::string body;
};

// "High Temperature Alert - <name or serial>" plus a plain-text body.
AlertMessage ComposeMessage(const alert::FiredAlert& alert);

} // namespace telemetry::notify
