#include "memory_repository.hpp"

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>

#include "memory_tx.hpp"

namespace telemetry::db::memory {

namespace {

using State = std::remove_reference_t<decltype(std::declval<MemoryTransaction&>().Mutable())>;

// Snapshot the current value of `key` in the map selected by `member` so a
// rollback puts it back (or erases it if it did not exist).
template <typename Map, typename Key>
void RememberEntry(MemoryTransaction& tx, Map State::*member, const Key& key) {
  auto&                                   table = tx.Mutable().*member;
  auto                                    it    = table.find(key);
  std::optional<typename Map::mapped_type> previous;
  if (it != table.end()) previous = it->second;

  tx.OnRollback([member, key, previous](State& s) {
    auto& t = s.*member;
    if (previous) {
      t[key] = *previous;
    } else {
      t.erase(key);
    }
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  RememberEntry(TX(t), &State::accounts, r.id);
  TX(t).Mutable().accounts[r.id] = r;
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(id);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.devices.contains(r.serial)) return Result::Err(ErrorCode::AlreadyExists, "device " + r.serial + " already exists");
  RememberEntry(TX(t), &State::devices, r.serial);
  s.devices[r.serial] = r;
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& serial) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(serial);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RenameDevice(Transaction& t, const std::string& serial, const std::string& name) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(serial);
  if (it == s.devices.end()) return Result::Err(ErrorCode::NotFound);
  RememberEntry(TX(t), &State::devices, serial);
  it->second.name = name;
  return Result::Ok();
}

Result MemoryRepository::TouchDevice(Transaction& t, const std::string& serial, uint64_t seen_ms, const std::string& ip) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(serial);
  if (it == s.devices.end()) return Result::Err(ErrorCode::NotFound);
  RememberEntry(TX(t), &State::devices, serial);
  it->second.last_seen_ms = seen_ms;
  if (!ip.empty()) it->second.last_ip = ip;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result MemoryRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.devices.contains(r.serial)) return Result::Err(ErrorCode::ConstraintViolation, "unknown device " + r.serial);

  r.id = s.next_credential_id++;
  s.credentials.push_back(r);
  TX(t).OnRollback([](State& st) {
    st.credentials.pop_back();
    --st.next_credential_id;
  });
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetActiveCredential(Transaction& t, const std::string& serial) {
  const auto& s = TX(t).View();
  for (auto it = s.credentials.rbegin(); it != s.credentials.rend(); ++it) {
    if (it->serial == serial && it->active) return *it;
  }
  return std::nullopt;
}

std::optional<model::ActiveCredential> MemoryRepository::GetActiveCredentialWithDevice(Transaction& t, const std::string& serial) {
  const auto& s      = TX(t).View();
  const auto  device = s.devices.find(serial);
  for (auto it = s.credentials.rbegin(); it != s.credentials.rend(); ++it) {
    if (it->serial == serial && it->active && device != s.devices.end()) return model::ActiveCredential{*it, device->second};
  }
  return std::nullopt;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentials(Transaction& t, const std::string& serial) {
  std::vector<model::CredentialRecord> out;
  for (const auto& c : TX(t).View().credentials)
    if (c.serial == serial) out.push_back(c);
  return out;
}

Result MemoryRepository::DeactivateCredentials(Transaction& t, const std::string& serial, uint64_t& deactivated) {
  auto& s     = TX(t).Mutable();
  deactivated = 0;
  for (std::size_t i = 0; i < s.credentials.size(); ++i) {
    auto& c = s.credentials[i];
    if (c.serial != serial || !c.active) continue;
    c.active = false;
    ++deactivated;
    TX(t).OnRollback([i](State& st) { st.credentials[i].active = true; });
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result MemoryRepository::AppendSample(Transaction& t, model::SampleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.devices.contains(r.serial)) return Result::Err(ErrorCode::ConstraintViolation, "unknown device " + r.serial);

  r.id = s.next_sample_id++;
  s.samples[r.serial].push_back(r);
  TX(t).OnRollback([serial = r.serial](State& st) {
    st.samples[serial].pop_back();
    --st.next_sample_id;
  });
  return Result::Ok();
}

std::vector<model::SampleRecord> MemoryRepository::ReadSamplesRange(Transaction& t, const std::string& serial, uint64_t start_ms, uint64_t end_ms,
                                                                    uint32_t limit) {
  std::vector<model::SampleRecord> out;
  const auto&                      s  = TX(t).View();
  auto                             it = s.samples.find(serial);
  if (it == s.samples.end()) return out;

  for (const auto& sample : it->second) {
    if (sample.received_at_ms >= start_ms && sample.received_at_ms < end_ms) out.push_back(sample);
  }

  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.received_at_ms != b.received_at_ms ? a.received_at_ms < b.received_at_ms : a.id < b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::SampleRecord> MemoryRepository::ReadRecentSamples(Transaction& t, const std::string& serial, uint32_t limit) {
  std::vector<model::SampleRecord> out;
  const auto&                      s  = TX(t).View();
  auto                             it = s.samples.find(serial);
  if (it == s.samples.end()) return out;

  out = it->second;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.received_at_ms != b.received_at_ms ? a.received_at_ms > b.received_at_ms : a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

model::OwnerUsageStats MemoryRepository::GetOwnerUsageStats(Transaction& t, const std::string& owner_id, uint32_t average_window) {
  const auto& s = TX(t).View();

  std::vector<const model::SampleRecord*> owned;
  for (const auto& [serial, device] : s.devices) {
    if (device.owner_id != owner_id) continue;
    auto it = s.samples.find(serial);
    if (it == s.samples.end()) continue;
    for (const auto& sample : it->second) owned.push_back(&sample);
  }

  model::OwnerUsageStats stats;
  stats.sample_count = owned.size();
  if (owned.empty() || average_window == 0) return stats;

  std::sort(owned.begin(), owned.end(), [](const auto* a, const auto* b) {
    return a->received_at_ms != b->received_at_ms ? a->received_at_ms > b->received_at_ms : a->id > b->id;
  });

  const std::size_t window = std::min<std::size_t>(owned.size(), average_window);
  double            total  = 0.0;
  for (std::size_t i = 0; i < window; ++i) total += static_cast<double>(owned[i]->raw_payload.size());
  stats.average_payload_bytes = total / static_cast<double>(window);
  return stats;
}

// ------------------------------------------------------------------
// Storage profiles
// ------------------------------------------------------------------

std::optional<model::StorageProfileRecord> MemoryRepository::GetStorageProfile(Transaction& t, const std::string& owner_id) {
  const auto& s  = TX(t).View();
  auto        it = s.profiles.find(owner_id);
  if (it == s.profiles.end()) return std::nullopt;
  return it->second;
}

std::vector<model::StorageProfileRecord> MemoryRepository::ListStorageProfiles(Transaction& t) {
  std::vector<model::StorageProfileRecord> out;
  for (const auto& [_, profile] : TX(t).View().profiles) out.push_back(profile);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.owner_id < b.owner_id; });
  return out;
}

Result MemoryRepository::UpsertStorageProfile(Transaction& t, const model::StorageProfileRecord& r) {
  RememberEntry(TX(t), &State::profiles, r.owner_id);
  TX(t).Mutable().profiles[r.owner_id] = r;
  return Result::Ok();
}

Result MemoryRepository::AddStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes) {
  RememberEntry(TX(t), &State::profiles, owner_id);
  auto& s  = TX(t).Mutable();
  auto  it = s.profiles.find(owner_id);
  if (it == s.profiles.end()) {
    model::StorageProfileRecord profile;
    profile.owner_id = owner_id;
    it               = s.profiles.emplace(owner_id, profile).first;
  }
  it->second.usage_bytes += bytes;
  return Result::Ok();
}

Result MemoryRepository::SetStorageUsage(Transaction& t, const std::string& owner_id, uint64_t bytes, uint64_t recomputed_at_ms) {
  RememberEntry(TX(t), &State::profiles, owner_id);
  auto& profile                  = TX(t).Mutable().profiles[owner_id];
  profile.owner_id               = owner_id;
  profile.usage_bytes            = bytes;
  profile.usage_recomputed_at_ms = recomputed_at_ms;
  return Result::Ok();
}

Result MemoryRepository::SetStoragePlan(Transaction& t, const std::string& owner_id, telemetry::gate::core::v1::StoragePlan plan) {
  RememberEntry(TX(t), &State::profiles, owner_id);
  auto& profile    = TX(t).Mutable().profiles[owner_id];
  profile.owner_id = owner_id;
  profile.plan     = plan;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Alerts
// ------------------------------------------------------------------

std::optional<model::AlertSettingsRecord> MemoryRepository::GetAlertSettings(Transaction& t, const std::string& serial) {
  const auto& s  = TX(t).View();
  auto        it = s.alert_settings.find(serial);
  if (it == s.alert_settings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAlertSettings(Transaction& t, const model::AlertSettingsRecord& r) {
  if (!TX(t).View().devices.contains(r.serial)) return Result::Err(ErrorCode::ConstraintViolation, "unknown device " + r.serial);
  RememberEntry(TX(t), &State::alert_settings, r.serial);
  TX(t).Mutable().alert_settings[r.serial] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertAlertState(Transaction& t, const model::AlertStateRecord& r) {
  const auto key = std::make_pair(r.serial, static_cast<int>(r.direction));
  RememberEntry(TX(t), &State::alert_states, key);
  TX(t).Mutable().alert_states[key] = r;
  return Result::Ok();
}

std::vector<model::AlertStateRecord> MemoryRepository::ListAlertStates(Transaction& t) {
  std::vector<model::AlertStateRecord> out;
  for (const auto& [_, state] : TX(t).View().alert_states) out.push_back(state);
  return out;
}

} // namespace telemetry::db::memory
