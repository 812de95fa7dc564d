#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace telemetry::ratelimit {

/*
  Fixed-window counter per key.

  The window index is floor(now / window); a request landing in a new
  index starts the count at zero, so a burst straddling a boundary may see
  up to 2x capacity admitted across the two windows.

  Locking:
    - map_mutex_ (shared) only to find or create the bucket
    - bucket mutex for the read-modify-write of the count
  Different keys never contend on the same bucket.
*/
class FixedWindowLimiter {
 public:
  struct Options {
    uint32_t                  capacity = 60;
    std::chrono::milliseconds window{std::chrono::seconds(60)};
  };

  FixedWindowLimiter(Options options, std::shared_ptr<util::ClockSource> clock);

  // Counts the attempt; true if it fits within the current window.
  bool TryAcquire(const std::string& key);

  // Drops buckets whose window has passed. Returns the number removed.
  std::size_t Sweep();

  std::size_t BucketCount() const;

  const Options& options() const {
    return options_;
  }

 private:
  struct Bucket {
    std::mutex mutex;
    int64_t    window_index = -1;
    uint32_t   count        = 0;
  };

  int64_t CurrentWindow() const;

  std::shared_ptr<Bucket> FindOrCreate(const std::string& key);

  Options                            options_;
  std::shared_ptr<util::ClockSource> clock_;

  mutable std::shared_mutex                                map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets_;
};

} // namespace telemetry::ratelimit
