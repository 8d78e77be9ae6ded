#ifndef ICA_CLIENT_MFA_CHALLENGE_H
#define ICA_CLIENT_MFA_CHALLENGE_H

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ica::client {

enum class MfaKind : std::uint8_t {
  kTrustedDevice = 0,
  kPush = 1,
  kSms = 2,
  kSecurityKey = 3
};

const char* MfaKindName(MfaKind kind);

// Device registered for two-step codes. |raw| is echoed back verbatim.
struct TrustedDevice {
  std::string id;
  std::string display_name;
  nlohmann::json raw;
};

struct TrustedPhoneNumber {
  std::int64_t id{0};
  std::string number;
  std::string push_mode;
};

struct FidoChallenge {
  std::string challenge;
  std::vector<std::string> key_handles;
  std::string rp_id;
};

struct MfaChallenge {
  MfaKind kind{MfaKind::kPush};
  bool has_phone{false};
  TrustedPhoneNumber phone;
  // True only when fsaChallenge carried every required field.
  bool has_fido{false};
  FidoChallenge fido;
  std::vector<std::string> key_names;
  std::vector<TrustedDevice> trusted_devices;
  std::uint32_t code_length{6};
};

// Builds a challenge from the auth endpoint's option document. |hsa2| selects
// between two-factor (push/SMS/key) and legacy two-step (trusted device).
void ParseMfaChallenge(const nlohmann::json& options, bool hsa2,
                       MfaChallenge& out);
bool ParseFidoChallenge(const nlohmann::json& fsa, FidoChallenge& out);
bool ParseTrustedDevice(const nlohmann::json& device, TrustedDevice& out);

}  // namespace ica::client

#endif  // ICA_CLIENT_MFA_CHALLENGE_H
