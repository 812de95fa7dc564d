#include "cooldown_table.hpp"

#include "internal/observability/logging.hpp"

namespace telemetry::alert {

CooldownTable::CooldownTable(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void CooldownTable::Hydrate() {
  auto tx     = repository_->Begin();
  auto states = repository_->ListAlertStates(*tx);
  tx->Commit();

  for (const auto& state : states) {
    auto            entry = FindOrCreate({state.serial, state.direction});
    std::lock_guard lock(entry->mutex);
    entry->last_fired = util::FromUnixMillis(state.last_fired_ms);
  }

  TELEMETRY_LOG_INFO("alert cooldown state hydrated", {observability::IntField("entries", static_cast<int64_t>(states.size()))});
}

std::shared_ptr<CooldownTable::Entry> CooldownTable::Find(const Key& key) const {
  std::shared_lock lock(map_mutex_);
  auto             it = entries_.find(key);
  return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<CooldownTable::Entry> CooldownTable::FindOrCreate(const Key& key) {
  if (auto entry = Find(key)) return entry;

  std::unique_lock lock(map_mutex_);
  auto&            slot = entries_[key];
  if (!slot) slot = std::make_shared<Entry>();
  return slot;
}

bool CooldownTable::TryFire(const Key& key, util::TimePoint now, std::chrono::minutes cooldown) {
  auto            entry = FindOrCreate(key);
  std::lock_guard lock(entry->mutex);

  if (model::PhaseAt(entry->last_fired, now, cooldown) != model::AlertPhase::kArmed) {
    return false;
  }

  db::model::AlertStateRecord record;
  record.serial        = key.first;
  record.direction     = key.second;
  record.last_fired_ms = util::ToUnixMillis(now);

  try {
    auto tx = repository_->Begin();
    if (auto r = repository_->UpsertAlertState(*tx, record); !r) {
      TELEMETRY_LOG_ERROR("alert state write failed", {observability::StringField("serial", key.first), observability::StringField("error", r.message)});
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("alert state write failed", {observability::StringField("serial", key.first), observability::StringField("error", e.what())});
    return false;
  }

  entry->last_fired = now;
  return true;
}

std::optional<util::TimePoint> CooldownTable::LastFired(const Key& key) const {
  auto entry = Find(key);
  if (!entry) return std::nullopt;

  std::lock_guard lock(entry->mutex);
  return entry->last_fired;
}

model::AlertPhase CooldownTable::PhaseOf(const Key& key, util::TimePoint now, std::chrono::minutes cooldown) const {
  return model::PhaseAt(LastFired(key), now, cooldown);
}

} // namespace telemetry::alert
