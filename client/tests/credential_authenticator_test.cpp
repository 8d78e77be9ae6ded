#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "credential_authenticator.h"
#include "encoding.h"
#include "fake_transport.h"

namespace {

#define FAIL()                                                              \
  do {                                                                      \
    std::cerr << "credential_authenticator_test failed at " << __FILE__     \
              << ":" << __LINE__ << "\n";                                   \
    return 1;                                                               \
  } while (false)

using ica::client::AuthResult;
using ica::client::AuthStatus;
using ica::client::CredentialAuthenticator;
using ica::client::Credentials;
using ica::client::ErrorKind;
using ica::client::MfaKind;
using ica::client::SrpChallenge;
using ica::client::SrpProtocol;
namespace keys = ica::client::session_keys;
namespace t = ica::client::testing;

const std::string kSignin = std::string(t::kAuth) + "/authorize/signin";
const std::string kInit = std::string(t::kAuth) + "/signin/init";
const std::string kComplete = std::string(t::kAuth) + "/signin/complete";

std::string InitBody(const std::string& protocol) {
  const std::vector<std::uint8_t> salt(16, 0x42);
  const std::vector<std::uint8_t> server_public(256, 0x5a);
  nlohmann::json body = {
      {"salt", ica::common::Base64Encode(salt)},
      {"b", ica::common::Base64Encode(server_public)},
      {"c", "d-74-1b0d6c9b"},
      {"iteration", 1000},
      {"protocol", protocol},
  };
  return body.dump();
}

void ScriptContext(t::FakeTransport& fake) {
  fake.Script("GET", kSignin,
              t::JsonReply(200, "{}", {{"scnt", "scnt-1"},
                                       {"X-Apple-ID-Session-Id", "sid-1"}}));
}

}  // namespace

int main() {
  {
    SrpChallenge challenge;
    std::string err;
    if (!ica::client::ParseSrpChallenge(InitBody("s2k_fo"), challenge, err)) {
      FAIL();
    }
    if (challenge.protocol != SrpProtocol::kS2kFo) FAIL();
    if (challenge.iterations != 1000 || challenge.salt.size() != 16) FAIL();
    if (ica::client::ParseSrpChallenge("{\"salt\":\"QQ==\"}", challenge, err)) {
      FAIL();
    }
    auto zero = nlohmann::json::parse(InitBody("s2k"));
    zero["iteration"] = 0;
    if (ica::client::ParseSrpChallenge(zero.dump(), challenge, err)) FAIL();
    auto unknown = nlohmann::json::parse(InitBody("s2k"));
    unknown["protocol"] = "s2k_legacy";
    if (ica::client::ParseSrpChallenge(unknown.dump(), challenge, err)) FAIL();
  }

  const auto dir = t::MakeTempDir("ica_credential_authenticator_test");
  const Credentials creds("user@example.com", "hunter2");

  {
    // Successful handshake stores the session token and echoes scnt.
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "ok", creds.identifier(), fake);
    session->MergeValues({{keys::kClientId, "auth-test"},
                          {keys::kTrustToken, "trust-1"}});
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::JsonReply(200, InitBody("s2k")));
    fake->Script("POST", kComplete,
                 t::JsonReply(200, "{}", {{"X-Apple-Session-Token", "tok"}}));

    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.Authenticate(creds);
    if (result.status != AuthStatus::kSuccess) FAIL();
    if (session->Value(keys::kSessionToken) != "tok") FAIL();

    const auto* init = fake->Last("POST", kInit);
    if (!init) FAIL();
    if (ica::client::FindHeader(init->request.headers, "scnt") != "scnt-1") FAIL();
    if (ica::client::FindHeader(init->request.headers, "X-Apple-OAuth-State") !=
        "auth-test") FAIL();
    const auto init_body = nlohmann::json::parse(init->request.body);
    if (init_body["accountName"] != "user@example.com") FAIL();
    if (init_body["protocols"].size() != 2) FAIL();
    if (init_body["a"].get<std::string>().empty()) FAIL();

    const auto* complete = fake->Last("POST", kComplete);
    if (!complete) FAIL();
    if (complete->request.query.empty() ||
        complete->request.query[0].first != "isRememberMeEnabled") FAIL();
    const auto complete_body = nlohmann::json::parse(complete->request.body);
    if (complete_body["c"] != "d-74-1b0d6c9b") FAIL();
    if (complete_body["trustTokens"].size() != 1 ||
        complete_body["trustTokens"][0] != "trust-1") FAIL();
    std::vector<std::uint8_t> m1;
    if (!ica::common::Base64Decode(complete_body["m1"].get<std::string>(), m1) ||
        m1.size() != 32) FAIL();
    // The password never leaves the process.
    if (complete->request.body.find("hunter2") != std::string::npos) FAIL();
  }

  {
    // 409 with hsa2 asks for a second factor and reads the options.
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "mfa", creds.identifier(), fake);
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::JsonReply(200, InitBody("s2k_fo")));
    fake->Script("POST", kComplete,
                 t::JsonReply(409, "{\"authType\":\"hsa2\"}",
                              {{"X-Apple-Session-Token", "pre-mfa"}}));
    fake->Script("GET", t::kAuth,
                 t::JsonReply(200,
                              "{\"trustedPhoneNumbers\":[{\"id\":3,"
                              "\"numberWithDialCode\":\"+1 (•••) •••-••55\","
                              "\"pushMode\":\"sms\"}],"
                              "\"noTrustedDevices\":true,"
                              "\"securityCode\":{\"length\":6}}"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.Authenticate(creds);
    if (result.status != AuthStatus::kMfaRequired) FAIL();
    if (result.challenge.kind != MfaKind::kSms) FAIL();
    if (!result.challenge.has_phone || result.challenge.phone.id != 3) FAIL();
    if (session->Value(keys::kSessionToken) != "pre-mfa") FAIL();
  }

  {
    // 409 for a two-step account falls back to device selection when the
    // options cannot be read.
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "hsa1", creds.identifier(), fake);
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::JsonReply(200, InitBody("s2k")));
    fake->Script("POST", kComplete, t::JsonReply(409, "{\"authType\":\"hsa\"}"));
    fake->Script("GET", t::kAuth, t::JsonReply(500, "{}"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.Authenticate(creds);
    if (result.status != AuthStatus::kMfaRequired) FAIL();
    if (result.challenge.kind != MfaKind::kTrustedDevice) FAIL();
  }

  {
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "bad_password", creds.identifier(), fake);
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::JsonReply(200, InitBody("s2k")));
    fake->Script("POST", kComplete, t::JsonReply(401, "{\"serviceErrors\":[{"
                                                      "\"code\":\"-20101\"}]}"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.AuthenticateWithRetry(creds, 3);
    if (result.status != AuthStatus::kError) FAIL();
    if (result.error.kind != ErrorKind::kInvalidCredentials) FAIL();
    if (result.error.message.rfind("Invalid email/password combination.", 0) !=
        0) FAIL();
    // Not retryable: one attempt only.
    if (fake->Count("POST", kComplete) != 1) FAIL();
  }

  {
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "init_rejected", creds.identifier(), fake);
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::JsonReply(401, "{}"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.Authenticate(creds);
    if (result.error.kind != ErrorKind::kInvalidCredentials) FAIL();
    if (result.error.message.rfind("Failed to initiate srp authentication.", 0) !=
        0) FAIL();
    if (fake->Count("POST", kComplete) != 0) FAIL();
  }

  {
    // A transport failure is retried with a fresh handshake.
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "retry", creds.identifier(), fake);
    ScriptContext(*fake);
    fake->Script("POST", kInit, t::NetworkFailure("connection reset"));
    fake->Script("POST", kInit, t::JsonReply(200, InitBody("s2k")));
    fake->Script("POST", kComplete, t::JsonReply(200, "{}"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.AuthenticateWithRetry(creds, 2);
    if (result.status != AuthStatus::kSuccess) FAIL();
    if (fake->Count("POST", kInit) != 2) FAIL();
    const auto first_a = nlohmann::json::parse(fake->recorded()[1].request.body)["a"];
    const auto second_a = nlohmann::json::parse(fake->Last("POST", kInit)->request.body)["a"];
    if (first_a == second_a) FAIL();
  }

  {
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "offline", creds.identifier(), fake);
    fake->Script("GET", kSignin, t::NetworkFailure("no route to host"));
    CredentialAuthenticator auth(*session);
    const AuthResult result = auth.AuthenticateWithRetry(creds, 2);
    if (result.error.kind != ErrorKind::kNetwork) FAIL();
    if (fake->Count("GET", kSignin) != 2) FAIL();
  }

  {
    const Credentials empty("user@example.com", "");
    t::FakeTransport* fake = nullptr;
    auto session = t::MakeSession(dir / "empty", empty.identifier(), fake);
    CredentialAuthenticator auth(*session);
    if (auth.Authenticate(empty).error.kind != ErrorKind::kInvalidCredentials) {
      FAIL();
    }
    if (!fake->recorded().empty()) FAIL();
  }
  return 0;
}
