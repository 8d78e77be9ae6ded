#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "encoding.h"
#include "fake_transport.h"
#include "session_coordinator.h"

namespace {

#define FAIL()                                                          \
  do {                                                                  \
    std::cerr << "session_coordinator_test failed at " << __FILE__      \
              << ":" << __LINE__ << "\n";                               \
    return 1;                                                           \
  } while (false)

using ica::client::ClassifiedError;
using ica::client::CoordinatorOptions;
using ica::client::Credentials;
using ica::client::ErrorKind;
using ica::client::HttpRequest;
using ica::client::HttpResponse;
using ica::client::LoginState;
using ica::client::MfaState;
using ica::client::SessionCoordinator;
using ica::client::SessionState;
using ica::client::SessionStore;
namespace keys = ica::client::session_keys;
namespace t = ica::client::testing;

constexpr char kAccount[] = "user@example.com";
const std::string kSignin = std::string(t::kAuth) + "/authorize/signin";
const std::string kInit = std::string(t::kAuth) + "/signin/init";
const std::string kComplete = std::string(t::kAuth) + "/signin/complete";
const std::string kTrusteddeviceCode =
    std::string(t::kAuth) + "/verify/trusteddevice/securitycode";
const std::string kTrust = std::string(t::kAuth) + "/2sv/trust";
const std::string kValidate = std::string(t::kSetup) + "/validate";
const std::string kAccountLogin = std::string(t::kSetup) + "/accountLogin";
const std::string kDrive = "https://drive.test/retrieveItemDetails";

constexpr char kTrustedAccount[] =
    "{\"dsInfo\":{\"dsid\":\"1001\",\"hsaVersion\":2},"
    "\"hsaTrustedBrowser\":true,"
    "\"webservices\":{\"drivews\":{\"url\":\"https://drive.test\"}}}";
constexpr char kOneFactorAccount[] =
    "{\"dsInfo\":{\"dsid\":\"1001\",\"hsaVersion\":2},"
    "\"hsaTrustedBrowser\":true,"
    "\"apps\":{\"drivews\":{\"canLaunchWithOneFactor\":true},"
    "\"photos\":{\"canLaunchWithOneFactor\":false}},"
    "\"webservices\":{\"drivews\":{\"url\":\"https://drive.test\"}}}";
constexpr char kUntrustedAccount[] =
    "{\"dsInfo\":{\"dsid\":\"1001\",\"hsaVersion\":2},"
    "\"hsaTrustedBrowser\":false,\"hsaChallengeRequired\":true}";

std::string InitBody() {
  nlohmann::json body = {
      {"salt", ica::common::Base64Encode(std::vector<std::uint8_t>(16, 0x42))},
      {"b", ica::common::Base64Encode(std::vector<std::uint8_t>(256, 0x5a))},
      {"c", "c-1"},
      {"iteration", 1000},
      {"protocol", "s2k"},
  };
  return body.dump();
}

void ScriptHandshake(t::FakeTransport& fake) {
  fake.Script("GET", kSignin, t::JsonReply(200, "{}", {{"scnt", "scnt-1"}}));
  fake.Script("POST", kInit, t::JsonReply(200, InitBody()));
}

bool SeedSession(const std::filesystem::path& dir, bool with_cookie) {
  SessionState state;
  state.Merge({{keys::kClientId, "auth-seeded"},
               {keys::kSessionToken, "persisted-token"},
               {keys::kTrustToken, "persisted-trust"}});
  if (with_cookie) {
    state.cookies().Set(t::WebAuthCookie("web"));
  }
  std::string err;
  return SessionStore(dir, kAccount).Save(state, err);
}

std::unique_ptr<SessionCoordinator> MakeCoordinator(
    const std::filesystem::path& dir, t::FakeTransport*& fake,
    CoordinatorOptions options = CoordinatorOptions{}) {
  auto session = t::MakeSession(dir, kAccount, fake);
  return std::make_unique<SessionCoordinator>(
      Credentials(kAccount, "hunter2"), std::move(session), std::move(options));
}

}  // namespace

int main() {
  const auto dir = t::MakeTempDir("ica_session_coordinator_test");

  {
    // A persisted token that still validates skips the handshake.
    const auto sub = dir / "valid_token";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::JsonReply(200, kTrustedAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();
    if (fake->Count("POST", kValidate) != 1) FAIL();
    if (fake->Count("GET", kSignin) != 0) FAIL();
    if (fake->Count("POST", kInit) != 0) FAIL();
    if (fake->Count("POST", kComplete) != 0) FAIL();
    if (coordinator->dsid() != "1001") FAIL();
    if (!coordinator->is_trusted_session()) FAIL();
    if (coordinator->session().Value(keys::kClientId) != "auth-seeded") FAIL();

    std::string url;
    if (!coordinator->WebserviceUrl("drivews", url, err)) FAIL();
    if (url != "https://drive.test") FAIL();
    if (coordinator->WebserviceUrl("photos", url, err)) FAIL();
    if (err.kind != ErrorKind::kServiceNotActivated) FAIL();
  }

  {
    // Token without the web auth cookie is not even sent for validation.
    const auto sub = dir / "no_cookie";
    if (!SeedSession(sub, false)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    fake->Script("POST", kAccountLogin, t::JsonReply(200, kTrustedAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();
    if (fake->Count("POST", kValidate) != 0) FAIL();
    if (fake->Count("POST", kInit) != 1) FAIL();
    const auto body = nlohmann::json::parse(
        fake->Last("POST", kAccountLogin)->request.body);
    if (body["trustToken"] != "persisted-trust") FAIL();
  }

  {
    // Fresh account: client id minted, 409 hsa2 leads to a pending challenge
    // which completes through the code and trust steps.
    const auto sub = dir / "two_factor";
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(409, "{\"authType\":\"hsa2\"}"));
    fake->Script("GET", t::kAuth, t::JsonReply(200, "{}"));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kMfaChallengePending) FAIL();
    if (coordinator->mfa().state() != MfaState::kAwaitingPushCode) FAIL();
    const std::string client_id = coordinator->session().Value(keys::kClientId);
    if (client_id.rfind("auth-", 0) != 0 || client_id.size() != 41) FAIL();
    if (SessionStore(sub, kAccount).Load().Get(keys::kClientId) != client_id) {
      FAIL();
    }

    if (coordinator->CompleteMfa(err) != LoginState::kMfaChallengePending) FAIL();
    if (err.kind != ErrorKind::kSecondFactorRequired) FAIL();

    fake->Script("POST", kTrusteddeviceCode, t::JsonReply(204, ""));
    fake->Script("GET", kTrust,
                 t::JsonReply(204, "", {{"X-Apple-TwoSV-Trust-Token", "t2"}}));
    fake->Script("POST", kAccountLogin, t::JsonReply(200, kTrustedAccount));
    if (!coordinator->mfa().SubmitPushOrSmsCode("123456", err)) FAIL();
    if (coordinator->CompleteMfa(err) != LoginState::kAuthenticated) FAIL();
    if (coordinator->session().Value(keys::kTrustToken) != "t2") FAIL();
  }

  {
    // Handshake accepted but the account still needs a second factor.
    const auto sub = dir / "untrusted";
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    fake->Script("POST", kAccountLogin, t::JsonReply(200, kUntrustedAccount));
    fake->Script("GET", t::kAuth, t::JsonReply(200, "{}"));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kMfaChallengePending) FAIL();
    if (!coordinator->requires_2fa() || !coordinator->requires_2sa()) FAIL();
  }

  {
    const auto sub = dir / "terms";
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    fake->Script("POST", kAccountLogin,
                 t::JsonReply(200, "{\"termsUpdateNeeded\":true}"));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kFailed) FAIL();
    if (err.kind != ErrorKind::kTermsAcceptanceRequired) FAIL();
  }

  {
    const auto sub = dir / "wrong_password";
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(401, "{}"));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kFailed) FAIL();
    if (err.kind != ErrorKind::kInvalidCredentials) FAIL();
    if (coordinator->state() != LoginState::kFailed) FAIL();
  }

  {
    const auto sub = dir / "offline_validate";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::NetworkFailure("dns failure"));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kFailed) FAIL();
    if (err.kind != ErrorKind::kNetwork) FAIL();
    if (fake->Count("POST", kInit) != 0) FAIL();
  }

  {
    // A service asking for reauthentication gets exactly one fresh
    // handshake and one retry.
    const auto sub = dir / "reauth";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::JsonReply(200, kTrustedAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();

    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    fake->Script("POST", kAccountLogin, t::JsonReply(200, kTrustedAccount));
    fake->Script("POST", kDrive, t::JsonReply(421, "{}"));
    fake->Script("POST", kDrive, t::JsonReply(200, "{\"items\":[]}"));

    HttpRequest request;
    request.method = "POST";
    request.url = kDrive;
    request.body = "[]";
    HttpResponse response;
    if (!coordinator->ServiceRequest(request, response, err)) FAIL();
    if (response.body != "{\"items\":[]}") FAIL();
    if (fake->Count("POST", kDrive) != 2) FAIL();
    if (fake->Count("POST", kInit) != 1) FAIL();
    if (fake->Count("POST", kValidate) != 1) FAIL();
    if (coordinator->state() != LoginState::kAuthenticated) FAIL();

    // Still rejected after reauthenticating: surface it, no loop.
    fake->Unscript("POST", kDrive);
    fake->Script("POST", kDrive, t::JsonReply(450, "{}"));
    const std::size_t inits_before = fake->Count("POST", kInit);
    const std::size_t drive_before = fake->Count("POST", kDrive);
    if (coordinator->ServiceRequest(request, response, err)) FAIL();
    if (err.kind != ErrorKind::kReauthRequired) FAIL();
    if (fake->Count("POST", kInit) != inits_before + 1) FAIL();
    if (fake->Count("POST", kDrive) != drive_before + 2) FAIL();
  }

  {
    // A service that launches with one factor signs in with the password
    // instead of a new handshake.
    const auto sub = dir / "one_factor";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::JsonReply(200, kOneFactorAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();
    if (!coordinator->account().CanLaunchWithOneFactor("drivews")) FAIL();
    if (coordinator->account().CanLaunchWithOneFactor("photos")) FAIL();
    if (coordinator->account().CanLaunchWithOneFactor("calendar")) FAIL();

    fake->Script("POST", kAccountLogin, t::JsonReply(200, "{}"));
    fake->Script("POST", kDrive, t::JsonReply(421, "{}"));
    fake->Script("POST", kDrive, t::JsonReply(200, "{\"items\":[]}"));
    HttpRequest request;
    request.method = "POST";
    request.url = kDrive;
    HttpResponse response;
    if (!coordinator->ServiceRequest(request, response, err, "drivews")) FAIL();
    if (response.body != "{\"items\":[]}") FAIL();
    if (fake->Count("GET", kSignin) != 0) FAIL();
    if (fake->Count("POST", kInit) != 0) FAIL();
    if (fake->Count("POST", kAccountLogin) != 1) FAIL();
    if (fake->Count("POST", kValidate) != 2) FAIL();
    const auto body = nlohmann::json::parse(
        fake->Last("POST", kAccountLogin)->request.body);
    if (body["appName"] != "drivews" || body["apple_id"] != kAccount) FAIL();
    if (body["password"] != "hunter2") FAIL();
    if (coordinator->state() != LoginState::kAuthenticated) FAIL();
  }

  {
    // A refused service sign-in falls back to the full handshake.
    const auto sub = dir / "one_factor_fallback";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::JsonReply(200, kOneFactorAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();

    ScriptHandshake(*fake);
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    fake->Script("POST", kAccountLogin, t::JsonReply(401, "{}"));
    fake->Script("POST", kAccountLogin, t::JsonReply(200, kTrustedAccount));
    if (!coordinator->Reauthenticate(true, err, "drivews")) FAIL();
    if (fake->Count("POST", kAccountLogin) != 2) FAIL();
    if (fake->Count("POST", kInit) != 1) FAIL();
    if (fake->Count("POST", kValidate) != 1) FAIL();
    const auto& calls = fake->recorded();
    bool saw_service_login = false;
    for (const auto& r : calls) {
      if (r.request.url == kAccountLogin &&
          r.request.body.find("\"appName\":\"drivews\"") != std::string::npos) {
        saw_service_login = true;
      }
    }
    if (!saw_service_login) FAIL();
    if (coordinator->state() != LoginState::kAuthenticated) FAIL();
  }

  {
    const auto sub = dir / "logout";
    if (!SeedSession(sub, true)) FAIL();
    t::FakeTransport* fake = nullptr;
    auto coordinator = MakeCoordinator(sub, fake);
    fake->Script("POST", kValidate, t::JsonReply(200, kTrustedAccount));
    ClassifiedError err;
    if (coordinator->Login(err) != LoginState::kAuthenticated) FAIL();
    if (!coordinator->Logout(err)) FAIL();
    if (coordinator->state() != LoginState::kStart) FAIL();
    std::error_code ec;
    if (std::filesystem::exists(SessionStore(sub, kAccount).session_path(), ec)) {
      FAIL();
    }
    if (coordinator->EnsureConsent("photos", err)) FAIL();
    if (err.kind != ErrorKind::kReauthRequired) FAIL();
  }
  return 0;
}
