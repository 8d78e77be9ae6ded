#ifndef ICA_CLIENT_SESSION_COORDINATOR_H
#define ICA_CLIENT_SESSION_COORDINATOR_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "account_service.h"
#include "auth_error.h"
#include "client_config.h"
#include "consent_poller.h"
#include "credential_authenticator.h"
#include "mfa_state_machine.h"
#include "session.h"

namespace ica::client {

enum class LoginState : std::uint8_t {
  kStart = 0,
  kValidatingToken = 1,
  kCredentialAuthenticating = 2,
  kMfaChallengePending = 3,
  kAuthenticated = 4,
  kFailed = 5
};

const char* LoginStateName(LoginState state);

struct CoordinatorOptions {
  bool accept_terms{false};
  std::uint32_t handshake_attempts{2};
  ConsentPolicy consent;
  // Used only when no client id was persisted.
  std::string client_id;
};

// Runs the login algorithm for one account and hands the authenticated
// session to service code. Not thread-safe; one coordinator per account.
class SessionCoordinator {
 public:
  SessionCoordinator(Credentials credentials,
                     std::unique_ptr<AuthSession> session,
                     CoordinatorOptions options = CoordinatorOptions{},
                     SleepFunction sleep = SleepFunction{});

  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;

  // Builds the libcurl-backed session described by |cfg|.
  static std::unique_ptr<SessionCoordinator> Create(const ClientConfig& cfg,
                                                    Credentials credentials,
                                                    std::string& error);

  // Reuses a persisted token when it still validates, otherwise runs the
  // password handshake. Ends in kAuthenticated, kMfaChallengePending or
  // kFailed.
  LoginState Login(ClassifiedError& error);
  // Call once mfa() has confirmed the second factor.
  LoginState CompleteMfa(ClassifiedError& error);
  // |force| skips token validation. When |service| may launch with one factor
  // it first signs in to that service with the password; the full handshake
  // runs only if that fails.
  bool Reauthenticate(bool force, ClassifiedError& error,
                      std::string_view service = {});
  // Forgets the session in memory and on disk.
  bool Logout(ClassifiedError& error);

  // Request on behalf of |service|. A reauth-required answer triggers one
  // forced reauthentication and a single retry.
  bool ServiceRequest(const HttpRequest& request, HttpResponse& out,
                      ClassifiedError& error, std::string_view service = {});
  bool EnsureConsent(const std::string& service_name, ClassifiedError& error);

  LoginState state() const { return state_; }
  bool requires_2sa() const { return account_.requires_2sa(); }
  bool requires_2fa() const { return account_.requires_2fa(); }
  bool is_trusted_session() const { return account_.is_trusted_session(); }
  bool WebserviceUrl(std::string_view key, std::string& out,
                     ClassifiedError& error) const {
    return account_.WebserviceUrl(key, out, error);
  }
  std::string dsid() const { return account_.dsid(); }
  QueryParams params() const { return account_.params(); }

  MfaStateMachine& mfa() { return mfa_; }
  AuthSession& session() { return *session_; }
  const AccountService& account() const { return account_; }
  const Credentials& credentials() const { return credentials_; }

 private:
  void EnsureClientId();
  LoginState Authenticate(bool force, std::string_view service,
                          ClassifiedError& error);
  LoginState Handshake(ClassifiedError& error);
  LoginState FinishLogin(ClassifiedError& error);
  LoginState Fail(const ClassifiedError& cause, ClassifiedError& error);

  Credentials credentials_;
  std::unique_ptr<AuthSession> session_;
  CoordinatorOptions options_;
  AccountService account_;
  CredentialAuthenticator authenticator_;
  MfaStateMachine mfa_;
  ConsentPoller consent_;
  LoginState state_{LoginState::kStart};
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SESSION_COORDINATOR_H
