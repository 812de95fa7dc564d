#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/model/alert_state.hpp"
#include "internal/util/time.hpp"

namespace telemetry::alert {

/*
  Last-fired time per (device, direction).

  TryFire() is an atomic read-modify-write under the entry's own mutex, so
  two samples of the same device racing across a threshold fire at most
  once per cooldown while other devices proceed in parallel. Every fire is
  written through to the repository before the entry is updated; a failed
  write leaves the entry ARMED.
*/
class CooldownTable {
 public:
  using Key = std::pair<std::string, telemetry::gate::core::v1::AlertDirection>;

  explicit CooldownTable(std::shared_ptr<db::Repository> repository);

  // Loads persisted state. Call once before serving.
  void Hydrate();

  // True if the pair was ARMED at `now`; it is then COOLING from `now`.
  bool TryFire(const Key& key, util::TimePoint now, std::chrono::minutes cooldown);

  std::optional<util::TimePoint> LastFired(const Key& key) const;

  model::AlertPhase PhaseOf(const Key& key, util::TimePoint now, std::chrono::minutes cooldown) const;

 private:
  struct Entry {
    std::mutex                     mutex;
    std::optional<util::TimePoint> last_fired;
  };

  std::shared_ptr<Entry> FindOrCreate(const Key& key);
  std::shared_ptr<Entry> Find(const Key& key) const;

  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex             map_mutex_;
  std::map<Key, std::shared_ptr<Entry>> entries_;
};

} // namespace telemetry::alert
