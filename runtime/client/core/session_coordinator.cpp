#include "session_coordinator.h"

#include <utility>

#include "config_service.h"
#include "platform_log.h"
#include "platform_random.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

constexpr char kTag[] = "coordinator";

}  // namespace

const char* LoginStateName(LoginState state) {
  switch (state) {
    case LoginState::kStart:
      return "start";
    case LoginState::kValidatingToken:
      return "validating_token";
    case LoginState::kCredentialAuthenticating:
      return "credential_authenticating";
    case LoginState::kMfaChallengePending:
      return "mfa_challenge_pending";
    case LoginState::kAuthenticated:
      return "authenticated";
    case LoginState::kFailed:
      return "failed";
  }
  return "failed";
}

SessionCoordinator::SessionCoordinator(Credentials credentials,
                                       std::unique_ptr<AuthSession> session,
                                       CoordinatorOptions options,
                                       SleepFunction sleep)
    : credentials_(std::move(credentials)),
      session_(std::move(session)),
      options_(std::move(options)),
      account_(*session_),
      authenticator_(*session_),
      mfa_(*session_, account_),
      consent_(*session_, account_, options_.consent, std::move(sleep)) {}

std::unique_ptr<SessionCoordinator> SessionCoordinator::Create(
    const ClientConfig& cfg, Credentials credentials, std::string& error) {
  error.clear();
  if (credentials.identifier().empty()) {
    error = "account identifier missing";
    return nullptr;
  }

  CurlOptions curl;
  curl.verify_tls = cfg.network.verify_tls;
  curl.ca_bundle = cfg.network.ca_bundle;
  curl.proxy = cfg.network.proxy;
  curl.connect_timeout_ms = cfg.network.connect_timeout_ms;
  std::unique_ptr<HttpTransport> transport =
      std::make_unique<CurlTransport>(curl);
  if (cfg.network.async_transport) {
    transport = std::make_unique<AsyncTransport>(std::move(transport));
  }

  SessionOptions session_options;
  session_options.timeout_ms = cfg.network.timeout_ms;
  session_options.classifier.access_denied_retryable =
      cfg.network.treat_access_denied_as_retryable;

  SessionStore store(ConfigService::ResolveCookieDirectory(cfg),
                     credentials.identifier());
  plog::Log(plog::Level::kDebug, kTag, "using session file",
            {{"path", store.session_path().string()}});
  auto session = std::make_unique<AuthSession>(
      std::move(transport), std::move(store),
      ConfigService::ResolveEndpoints(cfg), session_options);

  CoordinatorOptions options;
  options.accept_terms = cfg.session.accept_terms;
  options.handshake_attempts = cfg.session.handshake_attempts;
  options.consent.max_attempts = cfg.consent.max_attempts;
  options.consent.interval_ms = cfg.consent.interval_ms;
  options.client_id = cfg.session.client_id;
  return std::make_unique<SessionCoordinator>(
      std::move(credentials), std::move(session), std::move(options));
}

void SessionCoordinator::EnsureClientId() {
  if (session_->HasValue(session_keys::kClientId)) {
    return;
  }
  std::string client_id = options_.client_id;
  if (client_id.empty()) {
    client_id = "auth-" + ica::platform::RandomUuid();
  }
  session_->MergeValues({{session_keys::kClientId, client_id}});
}

LoginState SessionCoordinator::Fail(const ClassifiedError& cause,
                                    ClassifiedError& error) {
  error = cause;
  state_ = LoginState::kFailed;
  plog::Log(plog::Level::kError, kTag, "login failed",
            {{"error", error.ToString()}});
  return state_;
}

LoginState SessionCoordinator::Login(ClassifiedError& error) {
  error.Clear();
  state_ = LoginState::kStart;
  mfa_.Reset();
  account_.Clear();
  session_->Load();
  EnsureClientId();
  return Authenticate(false, {}, error);
}

LoginState SessionCoordinator::Authenticate(bool force,
                                            std::string_view service,
                                            ClassifiedError& error) {
  if (!force && session_->HasValue(session_keys::kSessionToken)) {
    state_ = LoginState::kValidatingToken;
    ClassifiedError validate_error;
    if (account_.ValidateToken(validate_error)) {
      return FinishLogin(error);
    }
    if (validate_error.kind == ErrorKind::kNetwork) {
      return Fail(validate_error, error);
    }
    plog::Log(plog::Level::kDebug, kTag,
              "invalid authentication token, will log in from scratch");
  }

  if (account_.CanLaunchWithOneFactor(service)) {
    state_ = LoginState::kCredentialAuthenticating;
    ClassifiedError service_error;
    if (account_.ServiceLogin(service, credentials_.identifier(),
                              credentials_.secret(), service_error)) {
      return FinishLogin(error);
    }
    plog::Log(plog::Level::kDebug, kTag,
              "could not log into service, attempting a brand new login",
              {{"service", std::string(service)}});
  }
  return Handshake(error);
}

LoginState SessionCoordinator::Handshake(ClassifiedError& error) {
  state_ = LoginState::kCredentialAuthenticating;
  session_->set_second_factor_outstanding(false);
  AuthResult result =
      authenticator_.AuthenticateWithRetry(credentials_, options_.handshake_attempts);
  if (result.status == AuthStatus::kError) {
    return Fail(result.error, error);
  }
  if (result.status == AuthStatus::kMfaRequired) {
    mfa_.Begin(result.challenge);
    state_ = LoginState::kMfaChallengePending;
    return state_;
  }

  ClassifiedError step_error;
  if (!account_.AccountLogin(step_error)) {
    return Fail(step_error, error);
  }
  if (!account_.HandleTerms(options_.accept_terms, step_error)) {
    return Fail(step_error, error);
  }
  return FinishLogin(error);
}

LoginState SessionCoordinator::FinishLogin(ClassifiedError& error) {
  if (account_.requires_2fa()) {
    MfaChallenge challenge;
    ClassifiedError options_error;
    if (!authenticator_.FetchMfaChallenge(true, challenge, options_error)) {
      plog::Log(plog::Level::kWarn, kTag, "second factor options unavailable",
                {{"error", options_error.ToString()}});
      ParseMfaChallenge(nlohmann::json::object(), true, challenge);
    }
    mfa_.Begin(challenge);
    state_ = LoginState::kMfaChallengePending;
    return state_;
  }
  if (account_.requires_2sa()) {
    MfaChallenge challenge;
    ParseMfaChallenge(nlohmann::json::object(), false, challenge);
    mfa_.Begin(challenge);
    state_ = LoginState::kMfaChallengePending;
    return state_;
  }
  error.Clear();
  state_ = LoginState::kAuthenticated;
  plog::Log(plog::Level::kInfo, kTag, "authentication completed",
            {{"trusted", account_.is_trusted_session() ? "1" : "0"}});
  return state_;
}

LoginState SessionCoordinator::CompleteMfa(ClassifiedError& error) {
  error.Clear();
  if (state_ != LoginState::kMfaChallengePending) {
    return state_;
  }
  switch (mfa_.state()) {
    case MfaState::kTrusted:
      break;
    case MfaState::kSessionTrustRequested: {
      // Code accepted but trust was refused; refresh the account document.
      ClassifiedError login_error;
      if (!account_.AccountLogin(login_error)) {
        return Fail(login_error, error);
      }
      plog::Log(plog::Level::kWarn, kTag,
                "session not trusted, the next login asks for a second factor");
      break;
    }
    case MfaState::kFailed:
      return Fail(MakeError(ErrorKind::kSecondFactorRequired,
                            "second factor confirmation failed"),
                  error);
    default:
      error = MakeError(ErrorKind::kSecondFactorRequired,
                        "second factor not confirmed yet");
      return state_;
  }

  ClassifiedError terms_error;
  if (!account_.HandleTerms(options_.accept_terms, terms_error)) {
    return Fail(terms_error, error);
  }
  session_->set_second_factor_outstanding(false);
  state_ = LoginState::kAuthenticated;
  plog::Log(plog::Level::kInfo, kTag, "authentication completed",
            {{"trusted", account_.is_trusted_session() ? "1" : "0"}});
  return state_;
}

bool SessionCoordinator::Reauthenticate(bool force, ClassifiedError& error,
                                        std::string_view service) {
  error.Clear();
  if (!force && state_ == LoginState::kAuthenticated) {
    return true;
  }
  plog::Log(plog::Level::kInfo, kTag, "reauthenticating",
            {{"force", force ? "1" : "0"}, {"service", std::string(service)}});
  mfa_.Reset();
  EnsureClientId();
  const LoginState result = Authenticate(force, service, error);
  if (result == LoginState::kAuthenticated) {
    return true;
  }
  if (result == LoginState::kMfaChallengePending) {
    error = MakeError(ErrorKind::kSecondFactorRequired,
                      "second factor required to reauthenticate");
  }
  return false;
}

bool SessionCoordinator::Logout(ClassifiedError& error) {
  error.Clear();
  account_.Clear();
  mfa_.Reset();
  state_ = LoginState::kStart;
  std::string reset_error;
  if (!session_->Reset(reset_error)) {
    error = MakeError(ErrorKind::kUnknown, reset_error);
    return false;
  }
  plog::Log(plog::Level::kInfo, kTag, "logged out");
  return true;
}

bool SessionCoordinator::ServiceRequest(const HttpRequest& request,
                                        HttpResponse& out,
                                        ClassifiedError& error,
                                        std::string_view service) {
  if (session_->Request(request, out, error)) {
    return true;
  }
  if (error.kind != ErrorKind::kReauthRequired) {
    return false;
  }
  plog::Log(plog::Level::kInfo, kTag, "service asked for reauthentication",
            {{"url", request.url}});
  ClassifiedError reauth_error;
  if (!Reauthenticate(true, reauth_error, service)) {
    error = reauth_error;
    return false;
  }
  return session_->Request(request, out, error);
}

bool SessionCoordinator::EnsureConsent(const std::string& service_name,
                                       ClassifiedError& error) {
  if (state_ != LoginState::kAuthenticated) {
    error = MakeError(ErrorKind::kReauthRequired, "not authenticated");
    return false;
  }
  return consent_.EnsureConsent(service_name, error);
}

}  // namespace ica::client
