#include "mfa_state_machine.h"

#include <nlohmann/json.hpp>

#include "encoding.h"
#include "platform_log.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

constexpr char kTag[] = "mfa";

}  // namespace

const char* MfaStateName(MfaState state) {
  switch (state) {
    case MfaState::kNoChallenge:
      return "no_challenge";
    case MfaState::kAwaitingTrustedDeviceSelection:
      return "awaiting_trusted_device_selection";
    case MfaState::kAwaitingSmsCode:
      return "awaiting_sms_code";
    case MfaState::kAwaitingPushCode:
      return "awaiting_push_code";
    case MfaState::kAwaitingSecurityKey:
      return "awaiting_security_key";
    case MfaState::kSessionTrustRequested:
      return "session_trust_requested";
    case MfaState::kTrusted:
      return "trusted";
    case MfaState::kFailed:
      return "failed";
  }
  return "failed";
}

MfaStateMachine::MfaStateMachine(AuthSession& session, AccountService& account)
    : session_(session), account_(account) {}

void MfaStateMachine::Begin(const MfaChallenge& challenge) {
  challenge_ = challenge;
  switch (challenge.kind) {
    case MfaKind::kTrustedDevice:
      state_ = MfaState::kAwaitingTrustedDeviceSelection;
      break;
    case MfaKind::kSms:
      state_ = MfaState::kAwaitingSmsCode;
      break;
    case MfaKind::kPush:
      state_ = MfaState::kAwaitingPushCode;
      break;
    case MfaKind::kSecurityKey:
      state_ = MfaState::kAwaitingSecurityKey;
      break;
  }
  plog::Log(plog::Level::kInfo, kTag, "challenge started",
            {{"kind", MfaKindName(challenge.kind)},
             {"state", MfaStateName(state_)}});
}

void MfaStateMachine::Reset() {
  challenge_ = MfaChallenge{};
  state_ = MfaState::kNoChallenge;
}

bool MfaStateMachine::IsWrongCode(const ClassifiedError& error) const {
  return error.code == kWrongVerificationCode;
}

bool MfaStateMachine::Fail(ClassifiedError& error) {
  state_ = MfaState::kFailed;
  plog::Log(plog::Level::kError, kTag, "confirmation failed",
            {{"error", error.ToString()}});
  return false;
}

HttpRequest MfaStateMachine::AuthRequest(const std::string& method,
                                         const std::string& path) const {
  HttpRequest request;
  request.method = method;
  request.url = session_.endpoints().auth + path;
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.AuthHeaders();
  SetHeader(request.headers, "Accept", "application/json");
  return request;
}

bool MfaStateMachine::ListTrustedDevices(std::vector<TrustedDevice>& out,
                                         ClassifiedError& error) {
  out.clear();
  error.Clear();
  HttpRequest request;
  request.method = "GET";
  request.url = session_.endpoints().setup + "/listDevices";
  request.query = account_.params();
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.WebHeaders();

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return false;
  }
  const auto doc = nlohmann::json::parse(response.body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = MakeError(ErrorKind::kProtocolError, "device list is not JSON");
    return false;
  }
  const auto devices = doc.find("devices");
  if (devices != doc.end() && devices->is_array()) {
    for (const auto& entry : *devices) {
      TrustedDevice device;
      if (ParseTrustedDevice(entry, device)) {
        out.push_back(std::move(device));
      }
    }
  }
  challenge_.trusted_devices = out;
  if (out.empty()) {
    plog::Log(plog::Level::kWarn, kTag, "no trusted devices registered");
  }
  return true;
}

bool MfaStateMachine::SendCode(const TrustedDevice& device,
                               ClassifiedError& error) {
  error.Clear();
  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().setup + "/sendVerificationCode";
  request.query = account_.params();
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.WebHeaders();
  request.body = device.raw.dump();

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return false;
  }
  const auto doc = nlohmann::json::parse(response.body, nullptr, false);
  bool sent = false;
  if (doc.is_object()) {
    const auto success = doc.find("success");
    sent = success != doc.end() && success->is_boolean() && success->get<bool>();
  }
  plog::Log(plog::Level::kInfo, kTag, "verification code requested",
            {{"device", device.display_name}, {"sent", sent ? "1" : "0"}});
  return sent;
}

bool MfaStateMachine::SubmitCode(const TrustedDevice& device,
                                 const std::string& code,
                                 ClassifiedError& error) {
  error.Clear();
  nlohmann::json body = device.raw.is_object() ? device.raw
                                               : nlohmann::json::object();
  body["verificationCode"] = code;
  body["trustBrowser"] = true;

  HttpRequest request;
  request.method = "POST";
  request.url = session_.endpoints().setup + "/validateVerificationCode";
  request.query = account_.params();
  request.timeout_ms = session_.timeout_ms();
  request.headers = session_.WebHeaders();
  request.body = body.dump();

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    if (IsWrongCode(error)) {
      plog::Log(plog::Level::kWarn, kTag, "wrong verification code");
      error.Clear();
      return false;
    }
    return Fail(error);
  }
  return OnCodeAccepted(error);
}

bool MfaStateMachine::SubmitPushOrSmsCode(const std::string& code,
                                          ClassifiedError& error) {
  error.Clear();
  HttpRequest request;
  nlohmann::json body = {{"securityCode", {{"code", code}}}};
  if (challenge_.has_phone && challenge_.kind == MfaKind::kSms) {
    request = AuthRequest("POST", "/verify/phone/securitycode");
    body["phoneNumber"] = {{"id", challenge_.phone.id}};
    body["mode"] = "sms";
  } else {
    request = AuthRequest("POST", "/verify/trusteddevice/securitycode");
  }
  request.body = body.dump();

  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    if (IsWrongCode(error)) {
      plog::Log(plog::Level::kWarn, kTag, "code verification failed");
      error.Clear();
      return false;
    }
    return Fail(error);
  }
  plog::Log(plog::Level::kDebug, kTag, "code verification successful");
  return OnCodeAccepted(error);
}

bool MfaStateMachine::RequestSmsCode(ClassifiedError& error) {
  error.Clear();
  if (!challenge_.has_phone) {
    error = MakeError(ErrorKind::kProtocolError, "no trusted phone number");
    return false;
  }
  HttpRequest request = AuthRequest("PUT", "/verify/phone");
  nlohmann::json body = {{"phoneNumber", {{"id", challenge_.phone.id}}},
                         {"mode", "sms"}};
  request.body = body.dump();
  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return false;
  }
  challenge_.kind = MfaKind::kSms;
  state_ = MfaState::kAwaitingSmsCode;
  plog::Log(plog::Level::kInfo, kTag, "sms code requested");
  return true;
}

bool MfaStateMachine::ConfirmSecurityKey(SecurityKeyDevice& device,
                                         ClassifiedError& error) {
  error.Clear();
  if (!challenge_.has_fido) {
    error = MakeError(ErrorKind::kProtocolError,
                      "security key challenge missing or incomplete");
    return Fail(error);
  }
  const FidoChallenge& fido = challenge_.fido;

  std::vector<SecurityKeyInfo> keys;
  std::string device_error;
  if (!device.ListDevices(keys, device_error) || keys.empty()) {
    error = MakeError(ErrorKind::kResourceUnavailable,
                      device_error.empty() ? "No security key attached"
                                           : device_error);
    return false;
  }

  AssertionRequest assertion_request;
  assertion_request.rp_id = fido.rp_id;
  if (!common::Base64UrlDecode(fido.challenge, assertion_request.challenge)) {
    error = MakeError(ErrorKind::kProtocolError, "security key challenge malformed");
    return Fail(error);
  }
  for (const auto& handle : fido.key_handles) {
    std::vector<std::uint8_t> id;
    if (common::Base64UrlDecode(handle, id)) {
      assertion_request.allowed_credentials.push_back(std::move(id));
    }
  }

  Assertion assertion;
  if (!device.GetAssertion(keys.front(), assertion_request, assertion,
                           device_error)) {
    error = MakeError(ErrorKind::kResourceUnavailable,
                      "security key assertion failed: " + device_error);
    return false;
  }

  HttpRequest request = AuthRequest("POST", "/verify/security/key");
  nlohmann::json body = {
      {"challenge", fido.challenge},
      {"rpId", fido.rp_id},
      {"clientData", common::Base64UrlEncode(assertion.client_data)},
      {"signatureData", common::Base64UrlEncode(assertion.signature)},
      {"authenticatorData",
       common::Base64UrlEncode(assertion.authenticator_data)},
      {"userHandle", common::Base64UrlEncode(assertion.user_handle)},
      {"credentialID", common::Base64UrlEncode(assertion.credential_id)},
  };
  request.body = body.dump();
  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    return Fail(error);
  }
  plog::Log(plog::Level::kInfo, kTag, "security key accepted",
            {{"device", keys.front().product}});
  return OnCodeAccepted(error);
}

bool MfaStateMachine::OnCodeAccepted(ClassifiedError& error) {
  state_ = MfaState::kSessionTrustRequested;
  ClassifiedError trust_error;
  if (!TrustSession(trust_error)) {
    plog::Log(plog::Level::kWarn, kTag, "confirmed without trusted session",
              {{"error", trust_error.ToString()}});
  }
  error.Clear();
  return true;
}

bool MfaStateMachine::TrustSession(ClassifiedError& error) {
  error.Clear();
  HttpRequest request = AuthRequest("GET", "/2sv/trust");
  SetHeader(request.headers, "Accept", "application/json, text/javascript");
  HttpResponse response;
  if (!session_.Request(request, response, error)) {
    plog::Log(plog::Level::kError, kTag, "session trust failed");
    return false;
  }
  if (!account_.AccountLogin(error)) {
    plog::Log(plog::Level::kError, kTag, "session trust failed");
    return false;
  }
  state_ = MfaState::kTrusted;
  plog::Log(plog::Level::kInfo, kTag, "session trusted");
  return true;
}

}  // namespace ica::client
