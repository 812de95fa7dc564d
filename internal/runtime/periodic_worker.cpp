#include "periodic_worker.hpp"

#include "internal/observability/logging.hpp"

namespace telemetry::runtime {

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&PeriodicWorker::Loop, this);
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicWorker::RunOnce() {
  try {
    task_();
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("background task failed", {observability::StringField("worker", name_), observability::StringField("error", e.what())});
  }
}

void PeriodicWorker::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace telemetry::runtime
