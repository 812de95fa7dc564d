#include "smtp_alert_sink.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace telemetry::notify {

namespace {

struct UploadState {
  const std::string* payload = nullptr;
  std::size_t        offset  = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
  auto*      state     = static_cast<UploadState*>(userp);
  const auto capacity  = size * nitems;
  const auto remaining = state->payload->size() - state->offset;
  const auto n         = std::min(capacity, remaining);
  std::memcpy(buffer, state->payload->data() + state->offset, n);
  state->offset += n;
  return n;
}

std::string WithCrlf(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 16);
  for (char c : text) {
    if (c == '\n') out.push_back('\r');
    out.push_back(c);
  }
  return out;
}

// RFC 5322 date-time, always UTC.
std::string MailDate(util::TimePoint tp) {
  const std::time_t t = util::Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buffer[64];
  std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S +0000", &utc);
  return buffer;
}

// Header values stay on one line; CR and LF become spaces.
std::string HeaderValue(const std::string& value) {
  std::string out = value;
  std::replace_if(out.begin(), out.end(), [](char c) { return c == '\r' || c == '\n'; }, ' ');
  return out;
}

std::string Bracketed(const std::string& address) {
  return "<" + HeaderValue(address) + ">";
}

// libcurl global state is process wide and not thread safe to set up.
void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw util::NotificationDispatchFailure("curl global init failed");
    }
  });
}

} // namespace

SmtpAlertSink::SmtpAlertSink(Options options) : options_(std::move(options)) {
  if (options_.url.empty()) {
    throw std::invalid_argument("smtp url is required");
  }
  EnsureCurlInitialized();
}

SmtpAlertSink::~SmtpAlertSink() = default;

std::string SmtpAlertSink::RenderPayload(const AlertMessage& message) const {
  std::string out;
  out += "Date: " + MailDate(util::Now()) + "\r\n";
  out += "To: " + Bracketed(message.recipient) + "\r\n";
  out += "From: " + Bracketed(options_.sender) + "\r\n";
  out += "Subject: " + HeaderValue(message.subject) + "\r\n";
  out += "Content-Type: text/plain; charset=utf-8\r\n";
  out += "\r\n";
  out += WithCrlf(message.body);
  return out;
}

void SmtpAlertSink::Send(const AlertMessage& message) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::NotificationDispatchFailure("failed to initialize curl");
  }

  const auto  payload = RenderPayload(message);
  UploadState upload{&payload, 0};

  const auto from = Bracketed(options_.sender);
  const auto to   = Bracketed(message.recipient);

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipients(curl_slist_append(nullptr, to.c_str()), &curl_slist_free_all);

  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, from.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
  if (!options_.username.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, options_.username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, options_.password.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
  }
  curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_callback);
  curl_easy_setopt(curl.get(), CURLOPT_READDATA, &upload);
  curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw util::NotificationDispatchFailure(std::string("smtp send failed: ") + curl_easy_strerror(res));
  }
}

} // namespace telemetry::notify
