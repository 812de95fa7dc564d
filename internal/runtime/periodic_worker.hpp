#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "background_worker.hpp"

namespace telemetry::runtime {

/*
  Runs `task` every `interval` on its own thread until stopped.

  Exceptions from the task are logged and the loop continues.
*/
class PeriodicWorker final : public BackgroundWorker {
 public:
  PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
  ~PeriodicWorker() override;

  void Start() override;
  void Stop() override;

  // Runs the task once on the calling thread.
  void RunOnce();

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     task_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace telemetry::runtime
