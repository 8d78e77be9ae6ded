#include "session_state.h"

namespace ica::client {

std::string SessionState::Get(std::string_view key) const {
  const auto it = values_.find(std::string(key));
  return it == values_.end() ? std::string() : it->second;
}

bool SessionState::Has(std::string_view key) const {
  const auto it = values_.find(std::string(key));
  return it != values_.end() && !it->second.empty();
}

bool SessionState::Merge(const SessionValues& updates) {
  bool changed = false;
  const auto client_id = updates.find(session_keys::kClientId);
  if (client_id != updates.end() && !client_id->second.empty()) {
    const auto current = values_.find(session_keys::kClientId);
    if (current != values_.end() && !current->second.empty() &&
        current->second != client_id->second) {
      // Tokens were issued to the previous client id.
      changed |= values_.erase(session_keys::kSessionToken) > 0;
      changed |= values_.erase(session_keys::kTrustToken) > 0;
    }
  }
  for (const auto& kv : updates) {
    if (kv.first.empty() || kv.second.empty()) {
      continue;
    }
    auto& slot = values_[kv.first];
    if (slot != kv.second) {
      slot = kv.second;
      changed = true;
    }
  }
  return changed;
}

bool SessionState::MergeFromHeaders(const HttpHeaders& headers) {
  SessionValues updates;
  for (const auto& tracked : kTrackedHeaders) {
    std::string value = FindHeader(headers, tracked.header);
    if (!value.empty()) {
      updates[tracked.key] = std::move(value);
    }
  }
  if (updates.empty()) {
    return false;
  }
  return Merge(updates);
}

void SessionState::Reset() {
  values_.clear();
  cookies_.Clear();
}

}  // namespace ica::client
