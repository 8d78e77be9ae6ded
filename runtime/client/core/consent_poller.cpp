#include "consent_poller.h"

#include <utility>

#include "platform_log.h"
#include "platform_time.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

constexpr char kTag[] = "consent";
constexpr char kUploadRequested[] = "Requested the device to upload cookies.";
constexpr char kCookiesPending[] = "Cookies not available yet on server.";

bool FlagOf(const nlohmann::json& doc, const char* key) {
  if (!doc.is_object()) {
    return false;
  }
  const auto it = doc.find(key);
  return it != doc.end() && it->is_boolean() && it->get<bool>();
}

std::string StringOf(const nlohmann::json& doc, const char* key) {
  if (!doc.is_object()) {
    return {};
  }
  const auto it = doc.find(key);
  return (it != doc.end() && it->is_string()) ? it->get<std::string>()
                                              : std::string();
}

}  // namespace

ConsentPoller::ConsentPoller(AuthSession& session,
                             const AccountService& account,
                             ConsentPolicy policy, SleepFunction sleep)
    : session_(session),
      account_(account),
      policy_(policy),
      sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::uint32_t ms) { ica::platform::SleepMs(ms); };
  }
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

bool ConsentPoller::BudgetLeft() const {
  return network_calls_ < policy_.max_attempts;
}

ClassifiedError ConsentPoller::TimeoutError(const char* what) const {
  return MakeError(ErrorKind::kConsentTimeout,
                   std::string(what) + " after " +
                       std::to_string(network_calls_) + " requests");
}

bool ConsentPoller::PostJson(const std::string& path, const std::string& body,
                             nlohmann::json& out, ClassifiedError& error) {
  ++network_calls_;
  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().setup + path;
  request.query = account_.params();
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.WebHeaders();
  SetHeader(request.headers, "Content-Type", "application/json");
  request.body = body;

  HttpResponse response;
  const bool ok = session_.Request(request, response, error);
  out = nlohmann::json::parse(response.body, nullptr, false);
  if (out.is_discarded()) {
    out = nlohmann::json::object();
  }
  return ok;
}

bool ConsentPoller::QueryState(bool& icdrs_disabled, bool& consented,
                               ClassifiedError& error) {
  nlohmann::json doc;
  if (!PostJson("/requestWebAccessState", "{}", doc, error)) {
    return false;
  }
  icdrs_disabled = FlagOf(doc, "isICDRSDisabled");
  consented = FlagOf(doc, "isDeviceConsentedForPCS");
  return true;
}

bool ConsentPoller::RequestDeviceConsent(ClassifiedError& error) {
  nlohmann::json doc;
  if (!PostJson("/enableDeviceConsentForPCS", "{}", doc, error)) {
    return false;
  }
  if (!FlagOf(doc, "isDeviceConsentNotificationSent")) {
    error = MakeError(ErrorKind::kUnknown, "Unable to request PCS access!");
    return false;
  }
  plog::Log(plog::Level::kInfo, kTag,
            "consent requested, confirm on a trusted device");
  return true;
}

bool ConsentPoller::WaitForDeviceConsent(ClassifiedError& error) {
  for (std::uint32_t attempt = 1; BudgetLeft(); ++attempt) {
    sleep_(policy_.interval_ms);
    bool icdrs_disabled = false;
    bool consented = false;
    if (!QueryState(icdrs_disabled, consented, error)) {
      return false;
    }
    if (consented) {
      return true;
    }
    plog::Log(plog::Level::kDebug, kTag, "waiting for device consent",
              {{"attempt", std::to_string(attempt)}});
  }
  error = TimeoutError("device consent not granted");
  return false;
}

bool ConsentPoller::EnsureConsent(const std::string& service_name,
                                  ClassifiedError& error) {
  error.Clear();
  last_attempts_ = 0;
  network_calls_ = 0;

  bool icdrs_disabled = false;
  bool consented = false;
  if (!QueryState(icdrs_disabled, consented, error)) {
    return false;
  }
  if (!icdrs_disabled) {
    plog::Log(plog::Level::kWarn, kTag, "ICDRS is not disabled");
    return true;
  }
  if (!consented) {
    if (!BudgetLeft()) {
      error = TimeoutError("device consent not requested");
      return false;
    }
    if (!RequestDeviceConsent(error) || !WaitForDeviceConsent(error)) {
      return false;
    }
  }

  for (std::uint32_t attempt = 1; BudgetLeft(); ++attempt) {
    last_attempts_ = attempt;
    const nlohmann::json body = {{"appName", service_name},
                                 {"derivedFromUserAction", attempt == 1}};
    nlohmann::json doc;
    ClassifiedError request_error;
    const bool ok = PostJson("/requestPCS", body.dump(), doc, request_error);
    if (ok && StringOf(doc, "status") == "success") {
      plog::Log(plog::Level::kInfo, kTag, "access granted",
                {{"service", service_name},
                 {"attempts", std::to_string(attempt)}});
      return true;
    }
    const std::string message = StringOf(doc, "message");
    if (message != kUploadRequested && message != kCookiesPending) {
      if (!ok) {
        error = request_error;
      } else {
        error = MakeError(ErrorKind::kUnknown,
                          message.empty() ? "PCS request refused" : message);
      }
      plog::Log(plog::Level::kError, kTag, "access request failed",
                {{"service", service_name}, {"error", error.ToString()}});
      return false;
    }
    plog::Log(plog::Level::kDebug, kTag, message,
              {{"attempt", std::to_string(attempt)}});
    if (BudgetLeft()) {
      sleep_(policy_.interval_ms);
    }
  }
  error = TimeoutError("PCS access not available");
  plog::Log(plog::Level::kError, kTag, "access request timed out",
            {{"service", service_name},
             {"requests", std::to_string(network_calls_)}});
  return false;
}

}  // namespace ica::client
