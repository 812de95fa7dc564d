#pragma once

#include <optional>
#include <string>

#include "internal/auth/credential_verifier.hpp"
#include "internal/db/model/sample_record.hpp"
#include "internal/util/time.hpp"
#include "telemetry/gate/services/v1/telemetry_ingest_service.pb.h"

namespace telemetry::pipeline {

/*
  Per-request state threaded through the gate chain.

  Inputs are set by the transport; each gate fills in what it
  establishes (device after auth, sample after validation).
*/
struct IngestContext {
  // transport inputs
  std::string     authorization;
  std::string     peer_address;
  util::TimePoint arrived_at;

  telemetry::gate::services::v1::TelemetryBody body;

  // request body exactly as received
  std::string raw_payload;

  // set when the body could not be decoded; rejected at validation
  std::string parse_error;

  // set by AuthGate
  std::optional<auth::VerifiedDevice> device;

  // set by ValidationGate
  std::optional<db::model::SampleRecord> sample;

  // body.device_ip if present, else the transport peer
  std::string DeviceAddress() const {
    return body.device_ip().empty() ? peer_address : body.device_ip();
  }
};

} // namespace telemetry::pipeline
