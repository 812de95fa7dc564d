#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace telemetry::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and ephemeral runs.

  Transactions are serialised on one mutex (the same single-writer model
  SQLite gives us) and roll back through an undo log.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string&) override;

  Result InsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  Result RenameDevice(Transaction&, const std::string& serial, const std::string& name) override;
  Result TouchDevice(Transaction&, const std::string& serial, uint64_t seen_ms, const std::string& ip) override;

  Result InsertCredential(Transaction&, model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetActiveCredential(Transaction&, const std::string&) override;
  std::optional<model::ActiveCredential> GetActiveCredentialWithDevice(Transaction&, const std::string&) override;
  std::vector<model::CredentialRecord> ListCredentials(Transaction&, const std::string&) override;
  Result DeactivateCredentials(Transaction&, const std::string& serial, uint64_t& deactivated) override;

  Result AppendSample(Transaction&, model::SampleRecord&) override;
  std::vector<model::SampleRecord> ReadSamplesRange(Transaction&, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                    uint32_t limit) override;
  std::vector<model::SampleRecord> ReadRecentSamples(Transaction&, const std::string& serial, uint32_t limit) override;
  model::OwnerUsageStats GetOwnerUsageStats(Transaction&, const std::string& owner_id, uint32_t average_window) override;

  std::optional<model::StorageProfileRecord> GetStorageProfile(Transaction&, const std::string&) override;
  std::vector<model::StorageProfileRecord> ListStorageProfiles(Transaction&) override;
  Result UpsertStorageProfile(Transaction&, const model::StorageProfileRecord&) override;
  Result AddStorageUsage(Transaction&, const std::string& owner_id, uint64_t bytes) override;
  Result SetStorageUsage(Transaction&, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) override;
  Result SetStoragePlan(Transaction&, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) override;

  std::optional<model::AlertSettingsRecord> GetAlertSettings(Transaction&, const std::string&) override;
  Result UpsertAlertSettings(Transaction&, const model::AlertSettingsRecord&) override;
  Result UpsertAlertState(Transaction&, const model::AlertStateRecord&) override;
  std::vector<model::AlertStateRecord> ListAlertStates(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::AccountRecord> accounts;
    std::unordered_map<std::string, model::DeviceRecord> devices;

    // insertion order == id order
    std::vector<model::CredentialRecord> credentials;
    std::unordered_map<std::string, std::vector<model::SampleRecord>> samples;

    std::unordered_map<std::string, model::StorageProfileRecord> profiles;
    std::unordered_map<std::string, model::AlertSettingsRecord> alert_settings;
    std::map<std::pair<std::string, int>, model::AlertStateRecord> alert_states;

    uint64_t next_credential_id = 1;
    uint64_t next_sample_id = 1;
  };

  std::mutex mutex_;
  State state_;
};

}
