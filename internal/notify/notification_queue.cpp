#include "notification_queue.hpp"

namespace telemetry::notify {

NotificationQueue::NotificationQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool NotificationQueue::TryEnqueue(alert::FiredAlert alert) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(alert));
  }
  cv_.notify_one();
  return true;
}

std::optional<alert::FiredAlert> NotificationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  alert::FiredAlert alert = std::move(queue_.front());
  queue_.pop();
  return alert;
}

void NotificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t NotificationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace telemetry::notify
