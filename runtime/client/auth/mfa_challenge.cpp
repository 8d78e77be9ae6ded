#include "mfa_challenge.h"

namespace ica::client {

namespace {

std::string StringField(const nlohmann::json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return {};
}

bool BoolField(const nlohmann::json& obj, const char* key) {
  const auto it = obj.find(key);
  return it != obj.end() && it->is_boolean() && it->get<bool>();
}

bool ParsePhone(const nlohmann::json& phone, TrustedPhoneNumber& out) {
  if (!phone.is_object()) {
    return false;
  }
  const auto id = phone.find("id");
  if (id == phone.end() || !id->is_number_integer()) {
    return false;
  }
  out.id = id->get<std::int64_t>();
  out.number = StringField(phone, "numberWithDialCode");
  if (out.number.empty()) {
    out.number = StringField(phone, "obfuscatedNumber");
  }
  out.push_mode = StringField(phone, "pushMode");
  if (out.push_mode.empty()) {
    out.push_mode = "sms";
  }
  return true;
}

}  // namespace

const char* MfaKindName(MfaKind kind) {
  switch (kind) {
    case MfaKind::kTrustedDevice:
      return "trusted_device";
    case MfaKind::kPush:
      return "push";
    case MfaKind::kSms:
      return "sms";
    case MfaKind::kSecurityKey:
      return "security_key";
  }
  return "push";
}

bool ParseFidoChallenge(const nlohmann::json& fsa, FidoChallenge& out) {
  out = FidoChallenge{};
  if (!fsa.is_object()) {
    return false;
  }
  out.challenge = StringField(fsa, "challenge");
  out.rp_id = StringField(fsa, "rpId");
  const auto handles = fsa.find("keyHandles");
  if (handles == fsa.end() || !handles->is_array()) {
    return false;
  }
  for (const auto& handle : *handles) {
    if (handle.is_string()) {
      out.key_handles.push_back(handle.get<std::string>());
    }
  }
  return !out.challenge.empty() && !out.rp_id.empty() &&
         !out.key_handles.empty();
}

bool ParseTrustedDevice(const nlohmann::json& device, TrustedDevice& out) {
  out = TrustedDevice{};
  if (!device.is_object()) {
    return false;
  }
  out.raw = device;
  out.id = StringField(device, "deviceId");
  if (out.id.empty()) {
    out.id = StringField(device, "id");
  }
  out.display_name = StringField(device, "deviceName");
  if (out.display_name.empty()) {
    const std::string phone = StringField(device, "phoneNumber");
    out.display_name = phone.empty() ? std::string("device") : "SMS to " + phone;
  }
  return true;
}

void ParseMfaChallenge(const nlohmann::json& options, bool hsa2,
                       MfaChallenge& out) {
  out = MfaChallenge{};
  out.kind = hsa2 ? MfaKind::kPush : MfaKind::kTrustedDevice;
  if (!options.is_object()) {
    return;
  }

  const auto phone = options.find("trustedPhoneNumber");
  if (phone != options.end()) {
    out.has_phone = ParsePhone(*phone, out.phone);
  }
  if (!out.has_phone) {
    const auto phones = options.find("trustedPhoneNumbers");
    if (phones != options.end() && phones->is_array() && phones->size() == 1) {
      out.has_phone = ParsePhone(phones->front(), out.phone);
    }
  }

  const auto security_code = options.find("securityCode");
  if (security_code != options.end() && security_code->is_object()) {
    const auto length = security_code->find("length");
    if (length != security_code->end() && length->is_number_unsigned()) {
      out.code_length = length->get<std::uint32_t>();
    }
  }

  const auto names = options.find("keyNames");
  if (names != options.end() && names->is_array()) {
    for (const auto& name : *names) {
      if (name.is_string()) {
        out.key_names.push_back(name.get<std::string>());
      }
    }
  }

  if (!hsa2) {
    return;
  }
  const auto fsa = options.find("fsaChallenge");
  if (fsa != options.end() && !fsa->is_null()) {
    out.kind = MfaKind::kSecurityKey;
    out.has_fido = ParseFidoChallenge(*fsa, out.fido);
    return;
  }
  const std::string mode = StringField(options, "mode");
  if (out.has_phone &&
      (mode == "sms" || BoolField(options, "noTrustedDevices"))) {
    out.kind = MfaKind::kSms;
  }
}

}  // namespace ica::client
