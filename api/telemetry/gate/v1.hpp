#pragma once

#include "telemetry/gate/core/v1/types.pb.h"

#include "telemetry/gate/device/v1/device.pb.h"

#include "telemetry/gate/services/v1/telemetry_ingest_service.pb.h"
#include "telemetry/gate/services/v1/telemetry_query_service.pb.h"
#include "telemetry/gate/services/v1/device_admin_service.pb.h"

#include "telemetry/gate/services/v1/telemetry_ingest_service.grpc.pb.h"
#include "telemetry/gate/services/v1/telemetry_query_service.grpc.pb.h"
#include "telemetry/gate/services/v1/device_admin_service.grpc.pb.h"

namespace telemetry::gate::v1 {
using namespace ::telemetry::gate::core::v1;
using namespace ::telemetry::gate::device::v1;
using namespace ::telemetry::gate::services::v1;
}
