#pragma once

namespace telemetry::runtime {

/*
  Long-lived thread(s) owned by the application. Start() is called once
  after construction; Stop() must be idempotent and join everything.
*/
class BackgroundWorker {
 public:
  virtual ~BackgroundWorker() = default;

  virtual void Start() = 0;
  virtual void Stop()  = 0;
};

} // namespace telemetry::runtime
