#include "credential_authenticator.h"

#include <utility>

#include <nlohmann/json.hpp>

#include "encoding.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

constexpr char kTag[] = "auth";
constexpr std::size_t kKeyLength = 32;

bool IsPassThrough(const ClassifiedError& error) {
  return error.kind == ErrorKind::kNetwork ||
         error.kind == ErrorKind::kRateLimited;
}

ClassifiedError InvalidCredentials(const ClassifiedError& cause,
                                   const char* message) {
  ClassifiedError err = cause;
  err.kind = ErrorKind::kInvalidCredentials;
  err.retryable = false;
  err.message = message;
  if (!cause.message.empty()) {
    err.message += " (" + cause.message + ")";
  }
  return err;
}

}  // namespace

Credentials::Credentials(std::string identifier, std::string secret)
    : identifier_(std::move(identifier)), secret_(std::move(secret)) {}

Credentials::~Credentials() { common::SecureWipe(secret_); }

Credentials::Credentials(Credentials&& other) noexcept
    : identifier_(std::move(other.identifier_)),
      secret_(std::move(other.secret_)) {
  common::SecureWipe(other.secret_);
  other.secret_.clear();
}

Credentials& Credentials::operator=(Credentials&& other) noexcept {
  if (this != &other) {
    common::SecureWipe(secret_);
    identifier_ = std::move(other.identifier_);
    secret_ = std::move(other.secret_);
    common::SecureWipe(other.secret_);
    other.secret_.clear();
  }
  return *this;
}

bool ParseSrpChallenge(const std::string& body, SrpChallenge& out,
                       std::string& error) {
  out = SrpChallenge{};
  error.clear();
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    error = "signin/init response is not a JSON object";
    return false;
  }
  const auto salt = json.find("salt");
  const auto b = json.find("b");
  const auto c = json.find("c");
  const auto iteration = json.find("iteration");
  if (salt == json.end() || !salt->is_string() || b == json.end() ||
      !b->is_string() || c == json.end() || !c->is_string() ||
      iteration == json.end() || !iteration->is_number_unsigned()) {
    error = "signin/init response missing fields";
    return false;
  }
  if (!common::Base64Decode(salt->get<std::string>(), out.salt) ||
      out.salt.empty()) {
    error = "signin/init salt malformed";
    return false;
  }
  if (!common::Base64Decode(b->get<std::string>(), out.server_public) ||
      out.server_public.empty()) {
    error = "signin/init server value malformed";
    return false;
  }
  const auto iterations = iteration->get<std::uint64_t>();
  if (iterations == 0 || iterations > 10000000) {
    error = "signin/init iteration count out of range";
    return false;
  }
  out.iterations = static_cast<std::uint32_t>(iterations);
  out.c = c->get<std::string>();
  out.key_length = kKeyLength;

  const auto protocol = json.find("protocol");
  if (protocol != json.end()) {
    if (!protocol->is_string() ||
        !ParseSrpProtocol(protocol->get<std::string>(), out.protocol)) {
      error = "signin/init protocol unsupported";
      return false;
    }
  }
  return true;
}

CredentialAuthenticator::CredentialAuthenticator(AuthSession& session)
    : session_(session) {}

AuthResult CredentialAuthenticator::AuthenticateWithRetry(
    const Credentials& credentials, std::uint32_t max_attempts) {
  if (max_attempts == 0) {
    max_attempts = 1;
  }
  AuthResult result;
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    result = Authenticate(credentials);
    if (result.status != AuthStatus::kError || !result.error.retryable) {
      return result;
    }
    plog::Log(plog::Level::kWarn, kTag, "handshake failed, retrying",
              {{"attempt", std::to_string(attempt)},
               {"error", result.error.ToString()}});
  }
  return result;
}

AuthResult CredentialAuthenticator::Authenticate(const Credentials& credentials) {
  AuthResult result;
  if (credentials.identifier().empty() || credentials.secret().empty()) {
    result.error = MakeError(ErrorKind::kInvalidCredentials, "credentials empty");
    return result;
  }
  plog::Log(plog::Level::kInfo, kTag, "authenticating",
            {{"account", credentials.identifier()}});

  if (!RequestSigningContext(result.error)) {
    return result;
  }

  SrpClient srp;
  std::string srp_error;
  if (!srp.Start(srp_error)) {
    result.error = MakeError(ErrorKind::kProtocolError, srp_error);
    return result;
  }
  SrpChallenge challenge;
  if (!InitHandshake(credentials, srp, challenge, result.error)) {
    return result;
  }
  return CompleteHandshake(credentials, srp, challenge);
}

bool CredentialAuthenticator::RequestSigningContext(ClassifiedError& error) {
  const Endpoints& ep = session_.endpoints();
  const std::string client_id = session_.Value(session_keys::kClientId);

  HttpRequest request;
  request.method = "GET";
  request.url = ep.auth + "/authorize/signin";
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.AuthHeaders();
  SetHeader(request.headers, "Accept", "text/html");
  request.query = {
      {"frame_id", client_id},
      {"skVersion", "7"},
      {"iframeId", client_id},
      {"client_id", kWidgetKey},
      {"redirect_uri", ep.home},
      {"response_type", "code"},
      {"response_mode", "web_message"},
      {"state", client_id},
      {"language", "en_US"},
  };
  HttpResponse response;
  if (session_.Request(request, response, error)) {
    return true;
  }
  if (IsPassThrough(error)) {
    return false;
  }
  // The context only seeds scnt and the session id; init reports the real
  // failure if they are missing.
  plog::Log(plog::Level::kDebug, kTag, "signing context unavailable",
            {{"error", error.ToString()}});
  error.Clear();
  return true;
}

bool CredentialAuthenticator::InitHandshake(const Credentials& credentials,
                                            SrpClient& srp,
                                            SrpChallenge& challenge,
                                            ClassifiedError& error) {
  nlohmann::json body = {
      {"a", common::Base64Encode(srp.public_value())},
      {"accountName", credentials.identifier()},
      {"protocols", {"s2k", "s2k_fo"}},
  };
  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().auth + "/signin/init";
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.AuthHeaders();
  request.body =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    if (!IsPassThrough(error)) {
      error = InvalidCredentials(error, "Failed to initiate srp authentication.");
    }
    return false;
  }
  std::string parse_error;
  if (!ParseSrpChallenge(response.body, challenge, parse_error)) {
    error = MakeError(ErrorKind::kProtocolError, parse_error);
    return false;
  }
  plog::Log(plog::Level::kDebug, kTag, "srp challenge received",
            {{"protocol", SrpProtocolName(challenge.protocol)},
             {"iterations", std::to_string(challenge.iterations)}});
  return true;
}

AuthResult CredentialAuthenticator::CompleteHandshake(
    const Credentials& credentials, SrpClient& srp,
    const SrpChallenge& challenge) {
  AuthResult result;
  common::SecureBuffer derived;
  std::string crypto_error;
  if (!DerivePassword(credentials.secret(), challenge.salt,
                      challenge.iterations, challenge.key_length,
                      challenge.protocol, derived, crypto_error)) {
    result.error = MakeError(ErrorKind::kProtocolError, crypto_error);
    return result;
  }
  SrpProof proof;
  if (!srp.ProcessChallenge(credentials.identifier(), derived, challenge.salt,
                            challenge.server_public, proof, crypto_error)) {
    result.error = MakeError(ErrorKind::kProtocolError, crypto_error);
    return result;
  }

  nlohmann::json body = {
      {"accountName", credentials.identifier()},
      {"c", challenge.c},
      {"m1", common::Base64Encode(proof.m1)},
      {"m2", common::Base64Encode(proof.m2)},
      {"rememberMe", true},
      {"trustTokens", nlohmann::json::array()},
  };
  const std::string trust_token = session_.Value(session_keys::kTrustToken);
  if (!trust_token.empty()) {
    body["trustTokens"].push_back(trust_token);
  }

  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().auth + "/signin/complete";
  request.query = {{"isRememberMeEnabled", "true"}};
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.AuthHeaders();
  request.body =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  HttpResponse response;
  ClassifiedError error;
  if (session_.Request(request, response, error)) {
    plog::Log(plog::Level::kInfo, kTag, "password proof accepted");
    result.status = AuthStatus::kSuccess;
    return result;
  }

  if (error.kind == ErrorKind::kSecondFactorRequired ||
      (error.kind == ErrorKind::kAuthChallenge &&
       error.http_status == kStatusSecondFactorRequired)) {
    const bool hsa2 = error.kind == ErrorKind::kSecondFactorRequired;
    plog::Log(plog::Level::kInfo, kTag, "second factor required",
              {{"hsa2", hsa2 ? "1" : "0"}});
    session_.set_second_factor_outstanding(true);
    ClassifiedError options_error;
    if (!FetchMfaChallenge(hsa2, result.challenge, options_error)) {
      if (options_error.kind == ErrorKind::kNetwork) {
        result.error = options_error;
        return result;
      }
      plog::Log(plog::Level::kWarn, kTag, "second factor options unavailable",
                {{"error", options_error.ToString()}});
      ParseMfaChallenge(nlohmann::json::object(), hsa2, result.challenge);
    }
    result.status = AuthStatus::kMfaRequired;
    return result;
  }

  if (IsPassThrough(error)) {
    result.error = error;
    return result;
  }
  result.error = InvalidCredentials(error, "Invalid email/password combination.");
  plog::Log(plog::Level::kWarn, kTag, "password proof rejected",
            {{"error", result.error.ToString()}});
  return result;
}

bool CredentialAuthenticator::FetchMfaChallenge(bool hsa2, MfaChallenge& out,
                                                ClassifiedError& error) {
  HttpRequest request;
  request.method = "GET";
  request.url = session_.endpoints().auth;
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.AuthHeaders();

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return false;
  }
  const auto options = nlohmann::json::parse(response.body, nullptr, false);
  if (options.is_discarded()) {
    error = MakeError(ErrorKind::kProtocolError,
                      "second factor options are not JSON");
    return false;
  }
  ParseMfaChallenge(options, hsa2, out);
  return true;
}

}  // namespace ica::client
