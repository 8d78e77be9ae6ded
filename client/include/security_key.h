#ifndef ICA_CLIENT_SECURITY_KEY_H
#define ICA_CLIENT_SECURITY_KEY_H

#include <cstdint>
#include <string>
#include <vector>

namespace ica::client {

struct SecurityKeyInfo {
  std::string path;
  std::string product;
};

struct AssertionRequest {
  std::string rp_id;
  // Raw challenge bytes, already decoded from base64url.
  std::vector<std::uint8_t> challenge;
  std::vector<std::vector<std::uint8_t>> allowed_credentials;
};

struct Assertion {
  std::vector<std::uint8_t> client_data;
  std::vector<std::uint8_t> signature;
  std::vector<std::uint8_t> authenticator_data;
  std::vector<std::uint8_t> user_handle;
  std::vector<std::uint8_t> credential_id;
};

// Boundary to a FIDO2 authenticator. Discovery and the CTAP exchange live
// behind this interface.
class SecurityKeyDevice {
 public:
  virtual ~SecurityKeyDevice() = default;

  virtual bool ListDevices(std::vector<SecurityKeyInfo>& out,
                           std::string& error) = 0;
  // Blocks until the user touches the key or the device gives up.
  virtual bool GetAssertion(const SecurityKeyInfo& device,
                            const AssertionRequest& request, Assertion& out,
                            std::string& error) = 0;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SECURITY_KEY_H
