#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "alert_sink.hpp"
#include "internal/runtime/background_worker.hpp"
#include "notification_queue.hpp"

namespace telemetry::notify {

/*
  Asynchronous alert delivery.

  Notify() only enqueues; worker threads compose and send. Failures (sink
  error, timeout, full queue, no recipient) are logged and counted and
  never reach the caller. No retry.
*/
class Notifier final : public runtime::BackgroundWorker {
 public:
  struct Options {
    uint32_t    worker_threads = 2;
    std::size_t queue_capacity = 1024;
  };

  Notifier(std::shared_ptr<AlertSink> sink, Options options);
  ~Notifier() override;

  void Start() override;

  // Delivers whatever is queued, then joins the workers.
  void Stop() override;

  void Notify(alert::FiredAlert alert);

  uint64_t Delivered() const {
    return delivered_.load();
  }
  uint64_t Failed() const {
    return failed_.load();
  }

 private:
  void Run();
  void Fail(const alert::FiredAlert& alert, std::string_view reason, std::string_view detail);

  std::shared_ptr<AlertSink>         sink_;
  Options                            options_;
  std::shared_ptr<NotificationQueue> queue_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace telemetry::notify
