#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "account_service.h"
#include "consent_poller.h"
#include "fake_transport.h"

namespace {

#define FAIL()                                                      \
  do {                                                              \
    std::cerr << "consent_poller_test failed at " << __FILE__       \
              << ":" << __LINE__ << "\n";                           \
    return 1;                                                       \
  } while (false)

using ica::client::AccountService;
using ica::client::ClassifiedError;
using ica::client::ConsentPolicy;
using ica::client::ConsentPoller;
using ica::client::ErrorKind;
namespace t = ica::client::testing;

const std::string kState = std::string(t::kSetup) + "/requestWebAccessState";
const std::string kEnable = std::string(t::kSetup) + "/enableDeviceConsentForPCS";
const std::string kPcs = std::string(t::kSetup) + "/requestPCS";

constexpr char kReady[] =
    "{\"isICDRSDisabled\":true,\"isDeviceConsentedForPCS\":true}";
constexpr char kNotConsented[] =
    "{\"isICDRSDisabled\":true,\"isDeviceConsentedForPCS\":false}";
constexpr char kUploadRequested[] =
    "{\"status\":\"failure\",\"message\":"
    "\"Requested the device to upload cookies.\"}";
constexpr char kCookiesPending[] =
    "{\"status\":\"failure\",\"message\":\"Cookies not available yet on server.\"}";

struct Harness {
  explicit Harness(const std::filesystem::path& dir)
      : session(t::MakeSession(dir, "user", fake)), account(*session) {}

  ConsentPoller Poller() {
    ConsentPolicy policy;
    policy.max_attempts = 10;
    policy.interval_ms = 5000;
    return ConsentPoller(*session, account, policy,
                         [this](std::uint32_t ms) { sleeps.push_back(ms); });
  }

  t::FakeTransport* fake{nullptr};
  std::unique_ptr<ica::client::AuthSession> session;
  AccountService account;
  std::vector<std::uint32_t> sleeps;
};

}  // namespace

int main() {
  const auto dir = t::MakeTempDir("ica_consent_poller_test");

  {
    // Granted on the third request.
    Harness h(dir / "third");
    h.fake->Script("POST", kState, t::JsonReply(200, kReady));
    h.fake->Script("POST", kPcs, t::JsonReply(200, kUploadRequested));
    h.fake->Script("POST", kPcs, t::JsonReply(200, kCookiesPending));
    h.fake->Script("POST", kPcs, t::JsonReply(200, "{\"status\":\"success\"}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (!poller.EnsureConsent("iclouddrive", err)) FAIL();
    if (!err.ok()) FAIL();
    if (poller.last_attempts() != 3) FAIL();
    if (h.fake->Count("POST", kPcs) != 3) FAIL();
    if (h.sleeps.size() != 2 || h.sleeps[0] != 5000) FAIL();

    std::vector<bool> user_action;
    for (const auto& r : h.fake->recorded()) {
      if (r.request.url == kPcs) {
        const auto body = nlohmann::json::parse(r.request.body);
        if (body["appName"] != "iclouddrive") FAIL();
        user_action.push_back(body["derivedFromUserAction"].get<bool>());
      }
    }
    if (user_action != std::vector<bool>{true, false, false}) FAIL();
  }

  {
    // Never granted: the state query and the access requests share one
    // budget of ten requests.
    Harness h(dir / "timeout");
    h.fake->Script("POST", kState, t::JsonReply(200, kReady));
    h.fake->Script("POST", kPcs, t::JsonReply(200, kCookiesPending));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (poller.EnsureConsent("photos", err)) FAIL();
    if (err.kind != ErrorKind::kConsentTimeout) FAIL();
    if (h.fake->recorded().size() != 10) FAIL();
    if (poller.last_network_calls() != 10) FAIL();
    if (h.fake->Count("POST", kPcs) != 9) FAIL();
    if (poller.last_attempts() != 9) FAIL();
    if (h.sleeps.size() != 8) FAIL();
  }

  {
    // Not under advanced protection: nothing to do.
    Harness h(dir / "icdrs");
    h.fake->Script("POST", kState,
                   t::JsonReply(200, "{\"isICDRSDisabled\":false}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (!poller.EnsureConsent("photos", err)) FAIL();
    if (h.fake->Count("POST", kPcs) != 0) FAIL();
  }

  {
    // Device consent is requested and awaited first.
    Harness h(dir / "consent");
    h.fake->Script("POST", kState, t::JsonReply(200, kNotConsented));
    h.fake->Script("POST", kState, t::JsonReply(200, kNotConsented));
    h.fake->Script("POST", kState, t::JsonReply(200, kReady));
    h.fake->Script("POST", kEnable,
                   t::JsonReply(200, "{\"isDeviceConsentNotificationSent\":true}"));
    h.fake->Script("POST", kPcs, t::JsonReply(200, "{\"status\":\"success\"}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (!poller.EnsureConsent("photos", err)) FAIL();
    if (h.fake->Count("POST", kEnable) != 1) FAIL();
    if (h.fake->Count("POST", kState) != 3) FAIL();
    if (poller.last_attempts() != 1) FAIL();
    if (poller.last_network_calls() != 5) FAIL();
  }

  {
    Harness h(dir / "not_sent");
    h.fake->Script("POST", kState, t::JsonReply(200, kNotConsented));
    h.fake->Script("POST", kEnable,
                   t::JsonReply(200, "{\"isDeviceConsentNotificationSent\":false}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (poller.EnsureConsent("photos", err)) FAIL();
    if (err.message != "Unable to request PCS access!") FAIL();
    if (h.fake->Count("POST", kPcs) != 0) FAIL();
  }

  {
    // Device never confirms.
    Harness h(dir / "no_device_consent");
    h.fake->Script("POST", kState, t::JsonReply(200, kNotConsented));
    h.fake->Script("POST", kEnable,
                   t::JsonReply(200, "{\"isDeviceConsentNotificationSent\":true}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (poller.EnsureConsent("photos", err)) FAIL();
    if (err.kind != ErrorKind::kConsentTimeout) FAIL();
    if (h.fake->recorded().size() != 10) FAIL();
    if (h.fake->Count("POST", kState) != 9) FAIL();
    if (h.fake->Count("POST", kPcs) != 0) FAIL();
  }

  {
    // An unexpected refusal stops immediately.
    Harness h(dir / "refused");
    h.fake->Script("POST", kState, t::JsonReply(200, kReady));
    h.fake->Script("POST", kPcs,
                   t::JsonReply(200, "{\"status\":\"failure\","
                                     "\"message\":\"Not allowed\"}"));
    ConsentPoller poller = h.Poller();
    ClassifiedError err;
    if (poller.EnsureConsent("photos", err)) FAIL();
    if (err.kind != ErrorKind::kUnknown || err.message != "Not allowed") FAIL();
    if (h.fake->Count("POST", kPcs) != 1) FAIL();
  }
  return 0;
}
