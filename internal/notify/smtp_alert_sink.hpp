#pragma once

#include <chrono>
#include <string>

#include "alert_sink.hpp"

namespace telemetry::notify {

/*
  Mail delivery through libcurl's SMTP client.

  One connection per message; the whole exchange is bounded by `timeout`.
*/
class SmtpAlertSink final : public AlertSink {
 public:
  struct Options {
    std::string               url;  // smtp://host:25 or smtps://host:465
    std::string               sender;
    std::string               username;
    std::string               password;
    std::chrono::milliseconds timeout{5000};
  };

  explicit SmtpAlertSink(Options options);
  ~SmtpAlertSink() override;

  SmtpAlertSink(const SmtpAlertSink&)            = delete;
  SmtpAlertSink& operator=(const SmtpAlertSink&) = delete;

  void Send(const AlertMessage& message) override;

  std::string_view Name() const override {
    return "smtp";
  }

  // RFC 5322 message with CRLF line endings.
  std::string RenderPayload(const AlertMessage& message) const;

 private:
  Options options_;
};

} // namespace telemetry::notify
