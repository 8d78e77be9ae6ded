#ifndef ICA_CLIENT_MFA_STATE_MACHINE_H
#define ICA_CLIENT_MFA_STATE_MACHINE_H

#include <cstdint>
#include <string>
#include <vector>

#include "account_service.h"
#include "auth_error.h"
#include "mfa_challenge.h"
#include "security_key.h"
#include "session.h"

namespace ica::client {

enum class MfaState : std::uint8_t {
  kNoChallenge = 0,
  kAwaitingTrustedDeviceSelection = 1,
  kAwaitingSmsCode = 2,
  kAwaitingPushCode = 3,
  kAwaitingSecurityKey = 4,
  kSessionTrustRequested = 5,
  kTrusted = 6,
  kFailed = 7
};

const char* MfaStateName(MfaState state);

// Drives one second-factor confirmation. A wrong code returns false with an
// empty error and leaves the state alone; anything else that goes wrong moves
// to kFailed and the caller has to start over with a new handshake.
class MfaStateMachine {
 public:
  MfaStateMachine(AuthSession& session, AccountService& account);

  void Begin(const MfaChallenge& challenge);
  void Reset();

  MfaState state() const { return state_; }
  const MfaChallenge& challenge() const { return challenge_; }
  const std::vector<std::string>& security_key_names() const {
    return challenge_.key_names;
  }

  // Two-step (legacy) flow.
  bool ListTrustedDevices(std::vector<TrustedDevice>& out,
                          ClassifiedError& error);
  bool SendCode(const TrustedDevice& device, ClassifiedError& error);
  bool SubmitCode(const TrustedDevice& device, const std::string& code,
                  ClassifiedError& error);

  // Two-factor flow. Goes to the phone endpoint when the challenge names a
  // trusted phone number for SMS delivery.
  bool SubmitPushOrSmsCode(const std::string& code, ClassifiedError& error);
  bool RequestSmsCode(ClassifiedError& error);
  bool ConfirmSecurityKey(SecurityKeyDevice& device, ClassifiedError& error);

  // Asks for a trusted session, then logs in again with the new trust token.
  // A rejection returns false without failing the machine.
  bool TrustSession(ClassifiedError& error);

 private:
  bool IsWrongCode(const ClassifiedError& error) const;
  bool Fail(ClassifiedError& error);
  bool OnCodeAccepted(ClassifiedError& error);
  HttpRequest AuthRequest(const std::string& method,
                          const std::string& path) const;

  AuthSession& session_;
  AccountService& account_;
  MfaChallenge challenge_;
  MfaState state_{MfaState::kNoChallenge};
};

}  // namespace ica::client

#endif  // ICA_CLIENT_MFA_STATE_MACHINE_H
