#ifndef ICA_CLIENT_SESSION_STATE_H
#define ICA_CLIENT_SESSION_STATE_H

#include <map>
#include <string>
#include <string_view>

#include "cookie_jar.h"
#include "http_transport.h"

namespace ica::client {

namespace session_keys {
constexpr char kAccountCountry[] = "account_country";
constexpr char kSessionId[] = "session_id";
constexpr char kSessionToken[] = "session_token";
constexpr char kTrustToken[] = "trust_token";
constexpr char kAuthAttributes[] = "auth_attributes";
constexpr char kScnt[] = "scnt";
constexpr char kClientId[] = "client_id";
}  // namespace session_keys

struct TrackedHeader {
  const char* header;
  const char* key;
};

// Response headers copied into the session map when present.
constexpr TrackedHeader kTrackedHeaders[] = {
    {"X-Apple-ID-Account-Country", session_keys::kAccountCountry},
    {"X-Apple-ID-Session-Id", session_keys::kSessionId},
    {"X-Apple-Session-Token", session_keys::kSessionToken},
    {"X-Apple-TwoSV-Trust-Token", session_keys::kTrustToken},
    {"X-Apple-Auth-Attributes", session_keys::kAuthAttributes},
    {"scnt", session_keys::kScnt},
};

using SessionValues = std::map<std::string, std::string>;

// Persistent key/value session fields plus the cookie jar. Values only change
// through Merge so that the client-id rule is applied everywhere.
class SessionState {
 public:
  std::string Get(std::string_view key) const;
  bool Has(std::string_view key) const;
  const SessionValues& values() const { return values_; }

  CookieJar& cookies() { return cookies_; }
  const CookieJar& cookies() const { return cookies_; }

  // Additive update. Empty values are ignored. A new client_id different from
  // the stored one first drops the tokens tied to the previous id. Returns
  // true if any stored value changed.
  bool Merge(const SessionValues& updates);
  bool MergeFromHeaders(const HttpHeaders& headers);

  // Drops every value and cookie.
  void Reset();
  bool empty() const { return values_.empty() && cookies_.empty(); }

 private:
  SessionValues values_;
  CookieJar cookies_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SESSION_STATE_H
