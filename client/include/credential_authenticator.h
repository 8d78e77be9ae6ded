#ifndef ICA_CLIENT_CREDENTIAL_AUTHENTICATOR_H
#define ICA_CLIENT_CREDENTIAL_AUTHENTICATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "auth_error.h"
#include "mfa_challenge.h"
#include "session.h"
#include "srp_client.h"

namespace ica::client {

// Account identifier and secret. The secret stays in this object and is wiped
// when it goes away.
class Credentials {
 public:
  Credentials(std::string identifier, std::string secret);
  ~Credentials();

  Credentials(const Credentials&) = delete;
  Credentials& operator=(const Credentials&) = delete;
  Credentials(Credentials&& other) noexcept;
  Credentials& operator=(Credentials&& other) noexcept;

  const std::string& identifier() const { return identifier_; }
  const std::string& secret() const { return secret_; }

 private:
  std::string identifier_;
  std::string secret_;
};

// Server parameters returned by signin/init.
struct SrpChallenge {
  std::vector<std::uint8_t> salt;
  std::vector<std::uint8_t> server_public;
  std::string c;
  std::uint32_t iterations{0};
  std::size_t key_length{32};
  SrpProtocol protocol{SrpProtocol::kS2k};
};

bool ParseSrpChallenge(const std::string& body, SrpChallenge& out,
                       std::string& error);

enum class AuthStatus : std::uint8_t { kSuccess = 0, kMfaRequired = 1, kError = 2 };

struct AuthResult {
  AuthStatus status{AuthStatus::kError};
  MfaChallenge challenge;
  ClassifiedError error;
};

class CredentialAuthenticator {
 public:
  explicit CredentialAuthenticator(AuthSession& session);

  AuthResult Authenticate(const Credentials& credentials);
  // Retries retryable failures only, with fresh ephemeral keys each time.
  AuthResult AuthenticateWithRetry(const Credentials& credentials,
                                   std::uint32_t max_attempts);

  // Reads the second-factor options published by the auth endpoint.
  bool FetchMfaChallenge(bool hsa2, MfaChallenge& out, ClassifiedError& error);

 private:
  bool RequestSigningContext(ClassifiedError& error);
  bool InitHandshake(const Credentials& credentials, SrpClient& srp,
                     SrpChallenge& challenge, ClassifiedError& error);
  AuthResult CompleteHandshake(const Credentials& credentials, SrpClient& srp,
                               const SrpChallenge& challenge);

  AuthSession& session_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_CREDENTIAL_AUTHENTICATOR_H
