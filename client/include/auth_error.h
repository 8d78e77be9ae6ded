#ifndef ICA_CLIENT_AUTH_ERROR_H
#define ICA_CLIENT_AUTH_ERROR_H

#include <cstdint>
#include <string>
#include <string_view>

namespace ica::client {

enum class ErrorKind : std::uint8_t {
  kNone = 0,
  kNetwork = 1,
  kAuthChallenge = 2,
  kInvalidCredentials = 3,
  kSecondFactorRequired = 4,
  kReauthRequired = 5,
  kServiceNotActivated = 6,
  kRateLimited = 7,
  kTermsAcceptanceRequired = 8,
  kConsentTimeout = 9,
  kProtocolError = 10,
  kResourceUnavailable = 11,
  kUnknown = 12
};

const char* ErrorKindName(ErrorKind kind);

struct ClassifiedError {
  ErrorKind kind{ErrorKind::kNone};
  std::string code;
  std::string message;
  bool retryable{false};
  int http_status{0};

  bool ok() const { return kind == ErrorKind::kNone; }
  void Clear() { *this = ClassifiedError{}; }
  std::string ToString() const;
};

ClassifiedError MakeError(ErrorKind kind, std::string message,
                          std::string code = {});

// Well-known status codes of the auth and setup endpoints.
constexpr int kStatusSecondFactorRequired = 409;
constexpr int kStatusLoginTokenExpired = 421;
constexpr int kStatusFindMyReauthRequired = 450;
constexpr int kStatusGeneralAuthError = 500;

// Server error code returned when a verification code does not match.
constexpr std::string_view kWrongVerificationCode = "-21669";

constexpr std::string_view kErrorZoneNotFound = "ZONE_NOT_FOUND";
constexpr std::string_view kErrorAuthenticationFailed = "AUTHENTICATION_FAILED";
constexpr std::string_view kErrorAccessDenied = "ACCESS_DENIED";
constexpr std::string_view kMissingWebAuthTokenReason =
    "Missing X-APPLE-WEBAUTH-TOKEN cookie";

// Raw result of one HTTP exchange as seen by the session layer.
struct TransportOutcome {
  bool transport_failed{false};
  std::string transport_error;
  int status{0};
  std::string reason_phrase;
  std::string content_type;
  std::string body;
};

struct ClassifyContext {
  // Set while the account still owes a two-step confirmation.
  bool second_factor_outstanding{false};
};

struct ClassifierPolicy {
  // ACCESS_DENIED is matched on a code string, not a documented throttling
  // signal. Turning this off reports it as a fatal rate-limit instead.
  bool access_denied_retryable{true};
};

class ErrorClassifier {
 public:
  explicit ErrorClassifier(ClassifierPolicy policy = ClassifierPolicy{})
      : policy_(policy) {}

  // Returns an error with kind == kNone when the outcome is a success.
  ClassifiedError Classify(const TransportOutcome& outcome,
                           const ClassifyContext& context) const;

  static bool IsJsonContentType(std::string_view content_type);
  static bool IsSuccessStatus(int status) {
    return status >= 200 && status < 300;
  }

 private:
  ClassifiedError FromCodeAndReason(const std::string& code,
                                    const std::string& reason,
                                    int http_status,
                                    const ClassifyContext& context) const;

  ClassifierPolicy policy_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_AUTH_ERROR_H
