#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/alert_settings_record.hpp"
#include "internal/db/model/alert_state_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/sample_record.hpp"
#include "internal/db/model/storage_profile_record.hpp"

namespace telemetry::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Sample and credential ids are assigned by the backend and strictly
    increase in insertion order
  - Backend failures on reads throw; failures on writes return a Result

  The DB is the source of truth for:
    devices and credentials
    telemetry samples
    storage profiles
    alert settings and cooldown state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Accounts
  // ---------------------------------------------------------------------

  virtual Result UpsertAccount(Transaction&, const model::AccountRecord&) = 0;

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& serial) = 0;

  virtual Result RenameDevice(Transaction&, const std::string& serial, const std::string& name) = 0;

  // Updates last-seen fields. An empty ip leaves the stored address unchanged.
  virtual Result TouchDevice(Transaction&, const std::string& serial, uint64_t seen_ms, const std::string& ip) = 0;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertCredential(Transaction&, model::CredentialRecord& record) = 0;

  virtual std::optional<model::CredentialRecord> GetActiveCredential(Transaction&, const std::string& serial) = 0;

  // One lookup whatever the outcome: empty for an unknown serial and for a
  // device without an active credential alike.
  virtual std::optional<model::ActiveCredential> GetActiveCredentialWithDevice(Transaction&, const std::string& serial) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentials(Transaction&, const std::string& serial) = 0;

  // Flips every active credential of the device to inactive.
  virtual Result DeactivateCredentials(Transaction&, const std::string& serial, uint64_t& deactivated) = 0;

  // ---------------------------------------------------------------------
  // Telemetry
  // ---------------------------------------------------------------------

  // Assigns record.id. received_at_ms must already be set.
  virtual Result AppendSample(Transaction&, model::SampleRecord& record) = 0;

  // [start_ms, end_ms) on received_at, ascending (received_at, id).
  virtual std::vector<model::SampleRecord> ReadSamplesRange(Transaction&, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                            uint32_t limit) = 0;

  // Newest first.
  virtual std::vector<model::SampleRecord> ReadRecentSamples(Transaction&, const std::string& serial, uint32_t limit) = 0;

  // Count of all samples of the owner's devices plus the average raw payload
  // length over the newest `average_window` of them.
  virtual model::OwnerUsageStats GetOwnerUsageStats(Transaction&, const std::string& owner_id, uint32_t average_window) = 0;

  // ---------------------------------------------------------------------
  // Storage profiles
  // ---------------------------------------------------------------------

  virtual std::optional<model::StorageProfileRecord> GetStorageProfile(Transaction&, const std::string& owner_id) = 0;

  virtual std::vector<model::StorageProfileRecord> ListStorageProfiles(Transaction&) = 0;

  virtual Result UpsertStorageProfile(Transaction&, const model::StorageProfileRecord&) = 0;

  // Creates a FREE profile when the owner has none.
  virtual Result AddStorageUsage(Transaction&, const std::string& owner_id, uint64_t bytes) = 0;

  // Overwrites usage and its timestamp only; the plan is left as stored.
  // Creates a FREE profile when the owner has none.
  virtual Result SetStorageUsage(Transaction&, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) = 0;

  // Overwrites the plan only; creates the profile with zero usage if missing.
  virtual Result SetStoragePlan(Transaction&, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) = 0;

  // ---------------------------------------------------------------------
  // Alerts
  // ---------------------------------------------------------------------

  virtual std::optional<model::AlertSettingsRecord> GetAlertSettings(Transaction&, const std::string& serial) = 0;

  virtual Result UpsertAlertSettings(Transaction&, const model::AlertSettingsRecord&) = 0;

  virtual Result UpsertAlertState(Transaction&, const model::AlertStateRecord&) = 0;

  virtual std::vector<model::AlertStateRecord> ListAlertStates(Transaction&) = 0;
};

} // namespace telemetry::db
