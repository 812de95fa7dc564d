#include "fixed_window_limiter.hpp"

#include <stdexcept>
#include <vector>

namespace telemetry::ratelimit {

FixedWindowLimiter::FixedWindowLimiter(Options options, std::shared_ptr<util::ClockSource> clock) : options_(options), clock_(std::move(clock)) {
  if (options_.window.count() <= 0) {
    throw std::invalid_argument("rate limit window must be positive");
  }
}

int64_t FixedWindowLimiter::CurrentWindow() const {
  const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->Now().time_since_epoch());
  return since_epoch.count() / options_.window.count();
}

std::shared_ptr<FixedWindowLimiter::Bucket> FixedWindowLimiter::FindOrCreate(const std::string& key) {
  {
    std::shared_lock lock(map_mutex_);
    auto             it = buckets_.find(key);
    if (it != buckets_.end()) return it->second;
  }

  std::unique_lock lock(map_mutex_);
  auto&            slot = buckets_[key];
  if (!slot) slot = std::make_shared<Bucket>();
  return slot;
}

bool FixedWindowLimiter::TryAcquire(const std::string& key) {
  auto       bucket = FindOrCreate(key);
  const auto window = CurrentWindow();

  std::lock_guard lock(bucket->mutex);
  if (bucket->window_index != window) {
    bucket->window_index = window;
    bucket->count        = 0;
  }

  ++bucket->count;
  return bucket->count <= options_.capacity;
}

std::size_t FixedWindowLimiter::Sweep() {
  const auto window = CurrentWindow();

  std::unique_lock lock(map_mutex_);
  std::size_t      removed = 0;
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    // A bucket still held by an in-flight TryAcquire is kept.
    bool stale = false;
    if (it->second.use_count() == 1) {
      std::lock_guard bucket_lock(it->second->mutex);
      stale = it->second->window_index < window;
    }
    if (stale) {
      it = buckets_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t FixedWindowLimiter::BucketCount() const {
  std::shared_lock lock(map_mutex_);
  return buckets_.size();
}

} // namespace telemetry::ratelimit
