#pragma once

#include "internal/db/model/alert_settings_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/sample_record.hpp"
#include "internal/db/model/storage_profile_record.hpp"
#include "internal/quota/plan_ceilings.hpp"
#include "telemetry/gate/core/v1/types.pb.h"
#include "telemetry/gate/device/v1/device.pb.h"

namespace telemetry::service {

/*
  Record <-> wire conversions. Zero millisecond fields ("never") leave the
  corresponding Timestamp unset.
*/

telemetry::gate::core::v1::TelemetrySample ToProto(const db::model::SampleRecord& r);

telemetry::gate::device::v1::Device ToProto(const db::model::DeviceRecord& r);

// Never carries salt or hash.
telemetry::gate::device::v1::CredentialInfo ToProto(const db::model::CredentialRecord& r);

telemetry::gate::device::v1::AlertSettings ToProto(const db::model::AlertSettingsRecord& r);
db::model::AlertSettingsRecord             FromProto(const telemetry::gate::device::v1::AlertSettings& p);

telemetry::gate::device::v1::StorageProfile ToProto(const db::model::StorageProfileRecord& r, const quota::PlanCeilings& ceilings);

} // namespace telemetry::service
