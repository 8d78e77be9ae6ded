#include "session.h"

#include <utility>

#include "platform_log.h"

namespace ica::client {

namespace plog = ica::platform::log;

Endpoints Endpoints::ForRegion(bool china_mainland) {
  Endpoints out;
  const std::string suffix = china_mainland ? ".com.cn" : ".com";
  out.auth = "https://idmsa.apple" + suffix + "/appleauth/auth";
  out.setup = "https://setup.icloud" + suffix + "/setup/ws/1";
  out.home = "https://www.icloud" + suffix;
  return out;
}

AuthSession::AuthSession(std::unique_ptr<HttpTransport> transport,
                         SessionStore store, Endpoints endpoints,
                         SessionOptions options)
    : transport_(std::move(transport)),
      store_(std::move(store)),
      endpoints_(std::move(endpoints)),
      options_(options),
      classifier_(options.classifier) {}

void AuthSession::Load() {
  SessionState loaded = store_.Load();
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = std::move(loaded);
}

bool AuthSession::Save(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.Save(state_, error);
}

bool AuthSession::Request(const HttpRequest& request, HttpResponse& out,
                          ClassifiedError& error) {
  error.Clear();
  out = HttpResponse{};
  if (!transport_) {
    error = MakeError(ErrorKind::kNetwork, "no transport");
    return false;
  }
  std::lock_guard<std::mutex> in_flight(request_mutex_);

  HttpRequest req = request;
  if (req.timeout_ms == 0) {
    req.timeout_ms = options_.timeout_ms;
  }
  CookieJar cookies;
  bool second_factor = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies = state_.cookies();
    second_factor = second_factor_outstanding_;
  }

  TransportOutcome outcome;
  std::string transport_error;
  if (!transport_->Send(req, cookies, out, transport_error)) {
    outcome.transport_failed = true;
    outcome.transport_error =
        transport_error.empty() ? "transport failed" : transport_error;
  } else {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.cookies() = std::move(cookies);
    state_.MergeFromHeaders(out.headers);
    std::string save_error;
    if (!store_.Save(state_, save_error)) {
      plog::Log(plog::Level::kWarn, "session", "session save failed",
                {{"error", save_error}});
    }
    outcome.status = out.status;
    outcome.reason_phrase = out.reason;
    outcome.content_type = out.content_type();
    outcome.body = out.body;
  }

  ClassifyContext context;
  context.second_factor_outstanding = second_factor;
  error = classifier_.Classify(outcome, context);
  if (!error.ok()) {
    plog::Log(plog::Level::kDebug, "session", "request failed",
              {{"url", req.url}, {"error", error.ToString()}});
    return false;
  }
  return true;
}

std::string AuthSession::Value(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.Get(key);
}

bool AuthSession::HasValue(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.Has(key);
}

bool AuthSession::HasCookie(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.cookies().Find(name) != nullptr;
}

SessionState AuthSession::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void AuthSession::MergeValues(const SessionValues& values) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.Merge(values)) {
    return;
  }
  std::string save_error;
  if (!store_.Save(state_, save_error)) {
    plog::Log(plog::Level::kWarn, "session", "session save failed",
              {{"error", save_error}});
  }
}

bool AuthSession::Reset(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.Reset();
  second_factor_outstanding_ = false;
  return store_.Clear(error);
}

HttpHeaders AuthSession::AuthHeaders() const {
  HttpHeaders headers = {
      {"Accept", "application/json, text/javascript"},
      {"Content-Type", "application/json"},
      {"Origin", endpoints_.home},
      {"Referer", endpoints_.home + "/"},
      {"X-Apple-OAuth-Client-Id", kWidgetKey},
      {"X-Apple-OAuth-Client-Type", "firstPartyAuth"},
      {"X-Apple-OAuth-Redirect-URI", endpoints_.home},
      {"X-Apple-OAuth-Require-Grant-Code", "true"},
      {"X-Apple-OAuth-Response-Mode", "web_message"},
      {"X-Apple-OAuth-Response-Type", "code"},
      {"X-Apple-Widget-Key", kWidgetKey},
  };
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string client_id = state_.Get(session_keys::kClientId);
  if (!client_id.empty()) {
    headers.emplace_back("X-Apple-OAuth-State", client_id);
    headers.emplace_back("X-Apple-Frame-Id", client_id);
  }
  if (state_.Has(session_keys::kScnt)) {
    headers.emplace_back("scnt", state_.Get(session_keys::kScnt));
  }
  if (state_.Has(session_keys::kSessionId)) {
    headers.emplace_back("X-Apple-ID-Session-Id",
                         state_.Get(session_keys::kSessionId));
  }
  if (state_.Has(session_keys::kAuthAttributes)) {
    headers.emplace_back("X-Apple-Auth-Attributes",
                         state_.Get(session_keys::kAuthAttributes));
  }
  return headers;
}

HttpHeaders AuthSession::WebHeaders() const {
  return {
      {"Accept", "*/*"},
      {"Content-Type", "text/plain"},
      {"Origin", endpoints_.home},
      {"Referer", endpoints_.home + "/"},
  };
}

void AuthSession::set_second_factor_outstanding(bool value) {
  std::lock_guard<std::mutex> lock(mutex_);
  second_factor_outstanding_ = value;
}

}  // namespace ica::client
