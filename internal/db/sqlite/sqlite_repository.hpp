#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace telemetry::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
