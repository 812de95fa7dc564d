#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/device_record.hpp"

namespace telemetry::db::model {

/*
  Stored device credential.

  Only the salt and SHA-256(salt || secret) are persisted, both as
  lowercase hex. At most one record per serial is active.
*/
struct CredentialRecord {
  uint64_t    id = 0;  // assigned by the backend on insert
  std::string serial;

  std::string salt_hex;
  std::string hash_hex;

  uint64_t created_at_ms = 0;

  // 0 = never expires
  uint64_t expires_at_ms = 0;

  bool active = true;
};

// Active credential joined with its device row.
struct ActiveCredential {
  CredentialRecord credential;
  DeviceRecord     device;
};

}
