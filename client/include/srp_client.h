#ifndef ICA_CLIENT_SRP_CLIENT_H
#define ICA_CLIENT_SRP_CLIENT_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "secure_buffer.h"

namespace ica::client {

enum class SrpProtocol : std::uint8_t { kS2k = 0, kS2kFo = 1 };

bool ParseSrpProtocol(std::string_view text, SrpProtocol& out);
const char* SrpProtocolName(SrpProtocol protocol);

// PBKDF2-HMAC-SHA256 over a SHA-256 pre-hash of the password. s2k feeds the
// raw digest, s2k_fo its lowercase hex form.
bool DerivePassword(std::string_view password,
                    const std::vector<std::uint8_t>& salt,
                    std::uint32_t iterations, std::size_t key_length,
                    SrpProtocol protocol, common::SecureBuffer& out,
                    std::string& error);

struct SrpProof {
  std::vector<std::uint8_t> m1;
  std::vector<std::uint8_t> m2;
  common::SecureBuffer session_key;
};

// SRP-6a client over the RFC 5054 2048-bit group with SHA-256. The identity
// is not mixed into x. One instance serves one handshake attempt.
class SrpClient {
 public:
  SrpClient();
  ~SrpClient();

  SrpClient(const SrpClient&) = delete;
  SrpClient& operator=(const SrpClient&) = delete;

  // Draws a fresh 256-bit private value and computes A.
  bool Start(std::string& error);
  // Fixed private value, for reproducible vectors.
  bool StartWithPrivate(const std::vector<std::uint8_t>& private_value,
                        std::string& error);

  const std::vector<std::uint8_t>& public_value() const { return public_; }

  bool ProcessChallenge(std::string_view identity,
                        const common::SecureBuffer& derived_password,
                        const std::vector<std::uint8_t>& salt,
                        const std::vector<std::uint8_t>& server_public,
                        SrpProof& out, std::string& error);

  // True when |server_m2| matches the proof expected for the last challenge.
  bool VerifyServerProof(const std::vector<std::uint8_t>& server_m2) const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::vector<std::uint8_t> public_;
  std::vector<std::uint8_t> expected_m2_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SRP_CLIENT_H
