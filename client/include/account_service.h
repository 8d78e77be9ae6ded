#ifndef ICA_CLIENT_ACCOUNT_SERVICE_H
#define ICA_CLIENT_ACCOUNT_SERVICE_H

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "auth_error.h"
#include "session.h"

namespace ica::client {

// Setup endpoint calls that turn an auth token into an account session, and
// the account document they return.
class AccountService {
 public:
  explicit AccountService(AuthSession& session);

  // POST validate. Requires the web auth cookie; without it no request is
  // made and the token counts as invalid.
  bool ValidateToken(ClassifiedError& error);
  // POST accountLogin with the stored session and trust tokens.
  bool AccountLogin(ClassifiedError& error);
  // Whether the account document lets |service| sign in with the password
  // alone.
  bool CanLaunchWithOneFactor(std::string_view service) const;
  // POST accountLogin for |service| with the account password, then validate.
  // Failures other than network ones are kInvalidCredentials.
  bool ServiceLogin(std::string_view service, const std::string& identifier,
                    const std::string& secret, ClassifiedError& error);
  // Pending terms: fails with kTermsAcceptanceRequired unless |accept_terms|,
  // otherwise accepts the current version and logs in again.
  bool HandleTerms(bool accept_terms, ClassifiedError& error);

  bool requires_2sa() const;
  bool requires_2fa() const;
  bool is_trusted_session() const;
  bool terms_update_needed() const;

  bool WebserviceUrl(std::string_view key, std::string& out,
                     ClassifiedError& error) const;
  std::string dsid() const;
  // clientId plus dsid once known.
  QueryParams params() const;

  const nlohmann::json& data() const { return data_; }
  bool has_data() const { return data_.is_object() && !data_.empty(); }
  void Clear() { data_ = nlohmann::json::object(); }

 private:
  bool PostForData(const std::string& path, const std::string& body,
                   ClassifiedError& error);
  void UpdateSecondFactorFlag();

  AuthSession& session_;
  nlohmann::json data_ = nlohmann::json::object();
};

}  // namespace ica::client

#endif  // ICA_CLIENT_ACCOUNT_SERVICE_H
