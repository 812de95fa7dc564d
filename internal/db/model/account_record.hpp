#pragma once

#include <string>

namespace telemetry::db::model {

struct AccountRecord {
  std::string id;
  std::string email;
};

}
