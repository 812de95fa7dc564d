#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace telemetry::util {

/*
  Time utilities: single place to control clock source.

  Components that make time-based decisions (rate windows, cooldowns,
  receipt timestamps) take a ClockSource so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC 3339 ("2024-05-01T12:00:00Z", "2024-05-01T12:00:00.250+02:00").
std::optional<TimePoint> ParseRfc3339(const std::string& text);
std::string              FormatRfc3339(TimePoint tp);

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public ClockSource {
 public:
  TimePoint Now() const override {
    return Clock::now();
  }
};

// Deterministic clock for tests and replay tooling.
class ManualClock final : public ClockSource {
 public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50)) : now_(start) {
  }

  TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Set(TimePoint tp) {
    std::lock_guard lock(mutex_);
    now_ = tp;
  }

  void Advance(Clock::duration d) {
    std::lock_guard lock(mutex_);
    now_ += d;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace telemetry::util
