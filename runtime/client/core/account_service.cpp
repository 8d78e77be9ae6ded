#include "account_service.h"

#include "platform_log.h"
#include "secure_buffer.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

constexpr char kTag[] = "account";
constexpr char kClientBuildNumber[] = "2021Project52";
constexpr char kClientMasteringNumber[] = "2021B29";

const nlohmann::json& Member(const nlohmann::json& obj, const char* key) {
  static const nlohmann::json kNull;
  if (!obj.is_object()) {
    return kNull;
  }
  const auto it = obj.find(key);
  return it == obj.end() ? kNull : *it;
}

bool FlagOf(const nlohmann::json& obj, const char* key) {
  const auto& value = Member(obj, key);
  return value.is_boolean() && value.get<bool>();
}

long long HsaVersion(const nlohmann::json& data) {
  const auto& version = Member(Member(data, "dsInfo"), "hsaVersion");
  return version.is_number_integer() ? version.get<long long>() : 0;
}

std::string StringOf(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  return {};
}

}  // namespace

AccountService::AccountService(AuthSession& session) : session_(session) {}

bool AccountService::PostForData(const std::string& path,
                                 const std::string& body,
                                 ClassifiedError& error) {
  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().setup + path;
  request.query = params();
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.WebHeaders();
  request.body = body;

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return false;
  }
  auto json = nlohmann::json::parse(response.body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    error = MakeError(ErrorKind::kProtocolError,
                      path + " response is not a JSON object");
    return false;
  }
  data_ = std::move(json);
  UpdateSecondFactorFlag();
  return true;
}

void AccountService::UpdateSecondFactorFlag() {
  session_.set_second_factor_outstanding(requires_2sa());
}

bool AccountService::ValidateToken(ClassifiedError& error) {
  error.Clear();
  if (!session_.HasCookie(kWebAuthTokenCookie)) {
    error = MakeError(ErrorKind::kReauthRequired,
                      std::string(kMissingWebAuthTokenReason));
    plog::Log(plog::Level::kDebug, kTag, "no web auth cookie, token invalid");
    return false;
  }
  plog::Log(plog::Level::kDebug, kTag, "checking session token validity");
  if (!PostForData("/validate", "null", error)) {
    plog::Log(plog::Level::kDebug, kTag, "invalid authentication token",
              {{"error", error.ToString()}});
    return false;
  }
  plog::Log(plog::Level::kDebug, kTag, "session token is still valid");
  return true;
}

bool AccountService::AccountLogin(ClassifiedError& error) {
  error.Clear();
  nlohmann::json body = {
      {"accountCountryCode", nullptr},
      {"dsWebAuthToken", session_.Value(session_keys::kSessionToken)},
      {"extended_login", true},
      {"trustToken", session_.Value(session_keys::kTrustToken)},
  };
  const std::string country = session_.Value(session_keys::kAccountCountry);
  if (!country.empty()) {
    body["accountCountryCode"] = country;
  }
  if (PostForData("/accountLogin", body.dump(), error)) {
    plog::Log(plog::Level::kDebug, kTag, "account login complete",
              {{"hsa_version", std::to_string(HsaVersion(data_))}});
    return true;
  }
  if (error.kind != ErrorKind::kNetwork &&
      error.kind != ErrorKind::kRateLimited &&
      error.kind != ErrorKind::kServiceNotActivated &&
      error.kind != ErrorKind::kProtocolError) {
    error.kind = ErrorKind::kInvalidCredentials;
    error.message = "Invalid authentication token. " + error.message;
  }
  return false;
}

bool AccountService::CanLaunchWithOneFactor(std::string_view service) const {
  if (service.empty()) {
    return false;
  }
  const auto& app = Member(Member(data_, "apps"), std::string(service).c_str());
  return FlagOf(app, "canLaunchWithOneFactor");
}

bool AccountService::ServiceLogin(std::string_view service,
                                  const std::string& identifier,
                                  const std::string& secret,
                                  ClassifiedError& error) {
  error.Clear();
  plog::Log(plog::Level::kDebug, kTag, "authenticating for service",
            {{"service", std::string(service)}});
  nlohmann::json body = {
      {"appName", std::string(service)},
      {"apple_id", identifier},
      {"password", secret},
  };
  std::string text =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  common::ScopedWipe text_wipe(text);
  common::SecureWipe(body["password"].get_ref<std::string&>());

  if (PostForData("/accountLogin", text, error) &&
      PostForData("/validate", "null", error)) {
    return true;
  }
  if (error.kind != ErrorKind::kNetwork) {
    error = MakeError(ErrorKind::kInvalidCredentials,
                      "Invalid email/password combination.", error.code);
  }
  plog::Log(plog::Level::kDebug, kTag, "service login failed",
            {{"service", std::string(service)}, {"error", error.ToString()}});
  return false;
}

bool AccountService::HandleTerms(bool accept_terms, ClassifiedError& error) {
  error.Clear();
  if (!terms_update_needed()) {
    return true;
  }
  if (!accept_terms) {
    error = MakeError(ErrorKind::kTermsAcceptanceRequired,
                      "You must accept the updated terms of service");
    return false;
  }
  plog::Log(plog::Level::kInfo, kTag, "accepting updated terms of service");

  const std::string locale =
      StringOf(Member(Member(data_, "dsInfo"), "languageCode"));
  HttpRequest terms;
  terms.method = "GET";
  terms.url = session_.endpoints().setup + "/getTerms";
  terms.query = params();
  terms.query.emplace_back("locale", locale);
  terms.timeout_ms = session_.timeout_ms();
  terms.headers = session_.WebHeaders();
  HttpResponse response;
  if (!session_.Request(terms, response, error)) {
    return false;
  }
  const auto doc = nlohmann::json::parse(response.body, nullptr, false);
  const std::string version =
      StringOf(Member(Member(doc, "iCloudTerms"), "version"));
  if (version.empty()) {
    error = MakeError(ErrorKind::kProtocolError, "terms version missing");
    return false;
  }

  HttpRequest accept;
  accept.method = "GET";
  accept.url = session_.endpoints().setup + "/repairDone";
  accept.query = params();
  accept.query.emplace_back("acceptedICloudTerms", version);
  accept.timeout_ms = session_.timeout_ms();
  accept.headers = session_.WebHeaders();
  if (!session_.Request(accept, response, error)) {
    return false;
  }
  return AccountLogin(error);
}

bool AccountService::requires_2sa() const {
  return HsaVersion(data_) >= 1 &&
         (FlagOf(data_, "hsaChallengeRequired") || !is_trusted_session());
}

bool AccountService::requires_2fa() const {
  return HsaVersion(data_) == 2 &&
         (FlagOf(data_, "hsaChallengeRequired") || !is_trusted_session());
}

bool AccountService::is_trusted_session() const {
  return FlagOf(data_, "hsaTrustedBrowser");
}

bool AccountService::terms_update_needed() const {
  return FlagOf(data_, "termsUpdateNeeded");
}

bool AccountService::WebserviceUrl(std::string_view key, std::string& out,
                                   ClassifiedError& error) const {
  out.clear();
  error.Clear();
  const auto& service = Member(Member(data_, "webservices"), std::string(key).c_str());
  const std::string url = StringOf(Member(service, "url"));
  if (url.empty()) {
    error = MakeError(ErrorKind::kServiceNotActivated,
                      "Webservice not available", std::string(key));
    return false;
  }
  out = url;
  return true;
}

std::string AccountService::dsid() const {
  return StringOf(Member(Member(data_, "dsInfo"), "dsid"));
}

QueryParams AccountService::params() const {
  QueryParams out = {
      {"clientBuildNumber", kClientBuildNumber},
      {"clientMasteringNumber", kClientMasteringNumber},
      {"clientId", session_.Value(session_keys::kClientId)},
  };
  const std::string id = dsid();
  if (!id.empty()) {
    out.emplace_back("dsid", id);
  }
  return out;
}

}  // namespace ica::client
