#ifndef ICA_CLIENT_CONSENT_POLLER_H
#define ICA_CLIENT_CONSENT_POLLER_H

#include <cstdint>
#include <functional>
#include <string>

#include "account_service.h"
#include "auth_error.h"
#include "session.h"

namespace ica::client {

struct ConsentPolicy {
  // Total requests one EnsureConsent may send, the initial state query
  // included.
  std::uint32_t max_attempts{10};
  std::uint32_t interval_ms{5000};
};

using SleepFunction = std::function<void(std::uint32_t ms)>;

// Obtains access to end-to-end protected service data. A trusted device has to
// upload keys first, so the loop waits for it within a bounded attempt budget.
class ConsentPoller {
 public:
  ConsentPoller(AuthSession& session, const AccountService& account,
                ConsentPolicy policy = ConsentPolicy{},
                SleepFunction sleep = SleepFunction{});

  bool EnsureConsent(const std::string& service_name, ClassifiedError& error);

  // requestPCS calls made by the last EnsureConsent.
  std::uint32_t last_attempts() const { return last_attempts_; }
  // Every request made by the last EnsureConsent.
  std::uint32_t last_network_calls() const { return network_calls_; }
  const ConsentPolicy& policy() const { return policy_; }

 private:
  bool QueryState(bool& icdrs_disabled, bool& consented,
                  ClassifiedError& error);
  bool RequestDeviceConsent(ClassifiedError& error);
  bool WaitForDeviceConsent(ClassifiedError& error);
  bool BudgetLeft() const;
  ClassifiedError TimeoutError(const char* what) const;
  bool PostJson(const std::string& path, const std::string& body,
                nlohmann::json& out, ClassifiedError& error);

  AuthSession& session_;
  const AccountService& account_;
  ConsentPolicy policy_;
  SleepFunction sleep_;
  std::uint32_t last_attempts_{0};
  std::uint32_t network_calls_{0};
};

}  // namespace ica::client

#endif  // ICA_CLIENT_CONSENT_POLLER_H
