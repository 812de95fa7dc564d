#include "internal/notify/notifier.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/notify/alert_message.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/notify/smtp_alert_sink.hpp"
#include "internal/util/errors.hpp"

namespace {

using telemetry::alert::FiredAlert;
using telemetry::notify::AlertMessage;
using telemetry::notify::Notifier;

class RecordingSink final : public telemetry::notify::AlertSink {
 public:
  explicit RecordingSink(bool fail = false) : fail_(fail) {
  }

  void Send(const AlertMessage& message) override {
    if (fail_) throw telemetry::util::NotificationDispatchFailure("relay refused");
    std::lock_guard lock(mutex_);
    sent_.push_back(message);
  }

  std::string_view Name() const override {
    return "recording";
  }

  std::vector<AlertMessage> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

 private:
  bool                      fail_;
  mutable std::mutex        mutex_;
  std::vector<AlertMessage> sent_;
};

FiredAlert Alert(const std::string& recipient) {
  FiredAlert alert;
  alert.serial         = "TH-001";
  alert.device_name    = "Nursery";
  alert.owner_id       = "owner-1";
  alert.recipient      = recipient;
  alert.direction      = telemetry::gate::core::v1::ALERT_DIRECTION_HIGH;
  alert.threshold_c    = 26.0;
  alert.temp_inside_c  = 27.25;
  alert.sample_id      = 42;
  alert.received_at_ms = 1705314600000ull;
  return alert;
}

void TestQueueIsBoundedAndDrainsAfterShutdown() {
  telemetry::notify::NotificationQueue queue(2);
  assert(queue.TryEnqueue(Alert("a@example.com")));
  assert(queue.TryEnqueue(Alert("b@example.com")));
  assert(!queue.TryEnqueue(Alert("c@example.com")));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.TryEnqueue(Alert("d@example.com")));

  auto first = queue.Dequeue();
  assert(first && first->recipient == "a@example.com");
  auto second = queue.Dequeue();
  assert(second && second->recipient == "b@example.com");
  assert(!queue.Dequeue());
}

void TestDeliversQueuedAlertsBeforeStopping() {
  auto     sink = std::make_shared<RecordingSink>();
  Notifier notifier(sink, {2, 64});
  notifier.Start();

  for (int i = 0; i < 10; ++i) notifier.Notify(Alert("owner@example.com"));
  notifier.Stop();

  assert(notifier.Delivered() == 10);
  assert(notifier.Failed() == 0);
  const auto sent = sink->Sent();
  assert(sent.size() == 10);
  assert(sent[0].recipient == "owner@example.com");
  assert(sent[0].subject == "High Temperature Alert - Nursery");
}

void TestFailuresAreCountedNotThrown() {
  auto     sink = std::make_shared<RecordingSink>(true);
  Notifier notifier(sink, {1, 8});
  notifier.Start();

  notifier.Notify(Alert("owner@example.com"));
  notifier.Notify(Alert(""));
  notifier.Stop();

  assert(notifier.Delivered() == 0);
  assert(notifier.Failed() == 2);
}

void TestFullQueueRejectsWithoutBlocking() {
  auto     sink = std::make_shared<RecordingSink>();
  Notifier notifier(sink, {1, 1});

  // not started: nothing drains the queue
  notifier.Notify(Alert("owner@example.com"));
  notifier.Notify(Alert("owner@example.com"));
  assert(notifier.Failed() == 1);

  notifier.Start();
  notifier.Stop();
  assert(notifier.Delivered() == 1);

  // stopped notifier drops new alerts
  notifier.Notify(Alert("owner@example.com"));
  assert(notifier.Failed() == 2);
}

void TestComposeMessage() {
  auto alert = Alert("owner@example.com");
  auto msg   = telemetry::notify::ComposeMessage(alert);
  assert(msg.recipient == "owner@example.com");
  assert(msg.subject == "High Temperature Alert - Nursery");
  assert(msg.body.find("above its configured threshold") != std::string::npos);
  assert(msg.body.find("Serial:       TH-001") != std::string::npos);
  assert(msg.body.find("Temperature:  27.2 C") != std::string::npos || msg.body.find("Temperature:  27.3 C") != std::string::npos);
  assert(msg.body.find("Threshold:    26.0 C") != std::string::npos);
  assert(msg.body.find("2024-01-15T10:30:00Z") != std::string::npos);

  alert.direction   = telemetry::gate::core::v1::ALERT_DIRECTION_LOW;
  alert.device_name = "";
  msg               = telemetry::notify::ComposeMessage(alert);
  assert(msg.subject == "Low Temperature Alert - TH-001");
  assert(msg.body.find("below its configured threshold") != std::string::npos);
}

void TestSmtpPayloadUsesCrlf() {
  telemetry::notify::SmtpAlertSink::Options options;
  options.url    = "smtp://127.0.0.1:1";
  options.sender = "alerts@example.com";
  telemetry::notify::SmtpAlertSink sink(options);

  const auto payload = sink.RenderPayload({"owner@example.com", "High Temperature Alert - Nursery", "line one\nline two\n"});
  assert(payload.rfind("Date: ", 0) == 0);
  assert(payload.find("To: <owner@example.com>\r\n") != std::string::npos);
  assert(payload.find("From: <alerts@example.com>\r\n") != std::string::npos);
  assert(payload.find("Subject: High Temperature Alert - Nursery\r\n") != std::string::npos);
  assert(payload.find("\r\n\r\nline one\r\nline two\r\n") != std::string::npos);
}

void TestSmtpHeadersStayOnOneLine() {
  telemetry::notify::SmtpAlertSink::Options options;
  options.url    = "smtp://127.0.0.1:1";
  options.sender = "alerts@example.com";
  telemetry::notify::SmtpAlertSink sink(options);

  const auto payload = sink.RenderPayload({"owner@example.com\r\nCc: other@example.com", "High Temperature Alert - Hallway\r\nBcc: attacker@evil.example",
                                           "body\n"});
  assert(payload.find("\r\nBcc:") == std::string::npos);
  assert(payload.find("\r\nCc:") == std::string::npos);
  assert(payload.find("Subject: High Temperature Alert - Hallway  Bcc: attacker@evil.example\r\n") != std::string::npos);

  // headers end at the first blank line and nothing else precedes it
  const auto headers = payload.substr(0, payload.find("\r\n\r\n"));
  std::size_t lines  = 1;
  for (std::size_t at = headers.find("\r\n"); at != std::string::npos; at = headers.find("\r\n", at + 2)) ++lines;
  assert(lines == 5);
}

void TestSinksShareOneCurlInitialization() {
  telemetry::notify::SmtpAlertSink::Options options;
  options.url     = "smtp://127.0.0.1:1";
  options.sender  = "alerts@example.com";
  options.timeout = std::chrono::milliseconds(1000);

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&options] {
      for (int j = 0; j < 16; ++j) telemetry::notify::SmtpAlertSink sink(options);
    });
  }
  for (auto& t : threads) t.join();

  // earlier sinks going away leaves curl usable for the next one
  telemetry::notify::SmtpAlertSink sink(options);
  bool threw = false;
  try {
    sink.Send({"owner@example.com", "subject", "body"});
  } catch (const telemetry::util::NotificationDispatchFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestSmtpUnreachableRelayThrows() {
  telemetry::notify::SmtpAlertSink::Options options;
  options.url     = "smtp://127.0.0.1:1";
  options.sender  = "alerts@example.com";
  options.timeout = std::chrono::milliseconds(1000);
  telemetry::notify::SmtpAlertSink sink(options);

  bool threw = false;
  try {
    sink.Send({"owner@example.com", "subject", "body"});
  } catch (const telemetry::util::NotificationDispatchFailure&) {
    threw = true;
  }
  assert(threw);

  bool rejected = false;
  try {
    telemetry::notify::SmtpAlertSink missing_url(telemetry::notify::SmtpAlertSink::Options{});
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestQueueIsBoundedAndDrainsAfterShutdown();
  TestDeliversQueuedAlertsBeforeStopping();
  TestFailuresAreCountedNotThrown();
  TestFullQueueRejectsWithoutBlocking();
  TestComposeMessage();
  TestSmtpPayloadUsesCrlf();
  TestSmtpHeadersStayOnOneLine();
  TestSmtpUnreachableRelayThrows();
  TestSinksShareOneCurlInitialization();

  std::cout << "telemetry_unit_notifier: pass\n";
  return 0;
}
