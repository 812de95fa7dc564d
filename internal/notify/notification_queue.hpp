#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/alert/fired_alert.hpp"

namespace telemetry::notify {

/*
  Bounded blocking queue between request threads and notifier workers.

  TryEnqueue never blocks: a full or shut-down queue rejects the alert.
  After Shutdown() workers drain what is left, then Dequeue() returns
  nullopt.
*/
class NotificationQueue {
 public:
  explicit NotificationQueue(std::size_t capacity);

  bool TryEnqueue(alert::FiredAlert alert);

  // blocking wait
  std::optional<alert::FiredAlert> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  const std::size_t             capacity_;
  mutable std::mutex            mutex_;
  std::condition_variable       cv_;
  std::queue<alert::FiredAlert> queue_;
  bool                          shutdown_ = false;
};

} // namespace telemetry::notify
