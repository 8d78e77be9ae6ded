#include "auth_error.h"

#include <algorithm>
#include <cctype>
#include <string>

#include <nlohmann/json.hpp>

#include "platform_log.h"

namespace ica::client {

namespace {

namespace plog = ica::platform::log;

constexpr char kUnknownReason[] = "Unknown reason";
constexpr char kAuthRequiredReason[] = "Authentication required for Account.";
constexpr char kServiceNotActivatedReason[] =
    "Please log into https://icloud.com/ to manually finish setting up your "
    "iCloud service";
constexpr char kThrottleSuffix[] =
    ".  Please wait a few minutes then try again.The remote servers might be "
    "trying to throttle requests.";

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string JsonScalarToString(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_number()) {
    return value.dump();
  }
  return {};
}

bool IsFalsy(const nlohmann::json& value) {
  if (value.is_null()) {
    return true;
  }
  if (value.is_boolean()) {
    return !value.get<bool>();
  }
  if (value.is_string() || value.is_array() || value.is_object()) {
    return value.empty();
  }
  if (value.is_number()) {
    return value.get<double>() == 0.0;
  }
  return false;
}

// errorMessage, reason, errorReason, error: the first one carrying a value
// wins. A non-string value still counts, it just carries no text.
// Older endpoints spell the list service_errors.
const nlohmann::json* FirstServiceError(const nlohmann::json& body) {
  for (const char* key : {"serviceErrors", "service_errors"}) {
    const auto errors = body.find(key);
    if (errors != body.end() && errors->is_array() && !errors->empty() &&
        errors->front().is_object()) {
      return &errors->front();
    }
  }
  return nullptr;
}

bool ExtractReason(const nlohmann::json& body, std::string& reason) {
  static constexpr const char* kReasonKeys[] = {"errorMessage", "reason",
                                                "errorReason", "error"};
  for (const char* key : kReasonKeys) {
    const auto it = body.find(key);
    if (it == body.end() || IsFalsy(*it)) {
      continue;
    }
    reason = it->is_string() ? it->get<std::string>() : kUnknownReason;
    return true;
  }
  if (const nlohmann::json* first = FirstServiceError(body)) {
    const auto msg = first->find("message");
    reason = (msg != first->end() && msg->is_string()) ? msg->get<std::string>()
                                                       : kUnknownReason;
    return true;
  }
  return false;
}

std::string ExtractCode(const nlohmann::json& body) {
  static constexpr const char* kCodeKeys[] = {"errorCode", "serverErrorCode"};
  for (const char* key : kCodeKeys) {
    const auto it = body.find(key);
    if (it != body.end() && !IsFalsy(*it)) {
      std::string code = JsonScalarToString(*it);
      if (!code.empty()) {
        return code;
      }
    }
  }
  if (const nlohmann::json* first = FirstServiceError(body)) {
    const auto code = first->find("code");
    if (code != first->end()) {
      return JsonScalarToString(*code);
    }
  }
  return {};
}

std::string AuthTypeOf(const nlohmann::json& body) {
  if (!body.is_object()) {
    return {};
  }
  const auto it = body.find("authType");
  if (it == body.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kNetwork:
      return "network";
    case ErrorKind::kAuthChallenge:
      return "auth_challenge";
    case ErrorKind::kInvalidCredentials:
      return "invalid_credentials";
    case ErrorKind::kSecondFactorRequired:
      return "second_factor_required";
    case ErrorKind::kReauthRequired:
      return "reauth_required";
    case ErrorKind::kServiceNotActivated:
      return "service_not_activated";
    case ErrorKind::kRateLimited:
      return "rate_limited";
    case ErrorKind::kTermsAcceptanceRequired:
      return "terms_acceptance_required";
    case ErrorKind::kConsentTimeout:
      return "consent_timeout";
    case ErrorKind::kProtocolError:
      return "protocol_error";
    case ErrorKind::kResourceUnavailable:
      return "resource_unavailable";
    case ErrorKind::kUnknown:
      return "unknown";
  }
  return "unknown";
}

std::string ClassifiedError::ToString() const {
  std::string out = ErrorKindName(kind);
  if (!code.empty()) {
    out.append(" (");
    out.append(code);
    out.push_back(')');
  }
  if (!message.empty()) {
    out.append(": ");
    out.append(message);
  }
  return out;
}

ClassifiedError MakeError(ErrorKind kind, std::string message,
                          std::string code) {
  ClassifiedError err;
  err.kind = kind;
  err.message = std::move(message);
  err.code = std::move(code);
  return err;
}

bool ErrorClassifier::IsJsonContentType(std::string_view content_type) {
  const std::string lower = ToLowerAscii(content_type);
  return lower.find("application/json") != std::string::npos ||
         lower.find("text/json") != std::string::npos;
}

ClassifiedError ErrorClassifier::Classify(const TransportOutcome& outcome,
                                          const ClassifyContext& context) const {
  if (outcome.transport_failed) {
    ClassifiedError err = MakeError(ErrorKind::kNetwork, outcome.transport_error);
    err.retryable = true;
    return err;
  }

  nlohmann::json body;
  bool have_json = false;
  if (IsJsonContentType(outcome.content_type) && !outcome.body.empty()) {
    body = nlohmann::json::parse(outcome.body, nullptr, false);
    if (body.is_discarded()) {
      plog::Log(plog::Level::kWarn, "classifier",
                "failed to parse response body as JSON",
                {{"status", std::to_string(outcome.status)}});
    } else {
      have_json = body.is_object();
    }
  }

  const bool success = IsSuccessStatus(outcome.status);
  if (!success) {
    switch (outcome.status) {
      case kStatusSecondFactorRequired: {
        ClassifiedError err;
        err.http_status = outcome.status;
        err.code = std::to_string(outcome.status);
        if (have_json && AuthTypeOf(body) == "hsa2") {
          err.kind = ErrorKind::kSecondFactorRequired;
          err.message = "Two-factor authentication required";
        } else {
          err.kind = ErrorKind::kAuthChallenge;
          err.message = "Two-step authentication required";
        }
        return err;
      }
      case kStatusLoginTokenExpired:
      case kStatusFindMyReauthRequired:
      case kStatusGeneralAuthError: {
        ClassifiedError err = MakeError(ErrorKind::kReauthRequired,
                                        kAuthRequiredReason,
                                        std::to_string(outcome.status));
        err.http_status = outcome.status;
        return err;
      }
      default:
        break;
    }
  }

  std::string code;
  std::string reason;
  bool has_reason = false;
  if (have_json) {
    has_reason = ExtractReason(body, reason);
    code = ExtractCode(body);
  }
  if (success && !has_reason) {
    return ClassifiedError{};
  }
  if (!has_reason) {
    reason = outcome.reason_phrase.empty() ? kUnknownReason
                                           : outcome.reason_phrase;
  }
  if (code.empty() && !success) {
    code = std::to_string(outcome.status);
  }
  return FromCodeAndReason(code, reason, outcome.status, context);
}

ClassifiedError ErrorClassifier::FromCodeAndReason(
    const std::string& code, const std::string& reason, int http_status,
    const ClassifyContext& context) const {
  ClassifiedError err;
  err.code = code;
  err.http_status = http_status;

  if (context.second_factor_outstanding &&
      reason == kMissingWebAuthTokenReason) {
    err.kind = ErrorKind::kSecondFactorRequired;
    err.message = "Two-step authentication required for account.";
    return err;
  }
  if (code == kErrorZoneNotFound || code == kErrorAuthenticationFailed) {
    err.kind = ErrorKind::kServiceNotActivated;
    err.message = kServiceNotActivatedReason;
    return err;
  }
  if (code == kErrorAccessDenied) {
    err.kind = ErrorKind::kRateLimited;
    err.message = reason + kThrottleSuffix;
    err.retryable = policy_.access_denied_retryable;
    return err;
  }

  err.kind = ErrorKind::kUnknown;
  err.message = reason;
  plog::Log(plog::Level::kError, "classifier", reason,
            {{"code", code}, {"status", std::to_string(http_status)}});
  return err;
}

}  // namespace ica::client
