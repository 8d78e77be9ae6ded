#include "client_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace ica::client {

namespace {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long v = std::strtoul(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFu) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(text);
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

bool IsHttpsUrl(const std::string& url) {
  return url.rfind("https://", 0) == 0 && url.size() > 8;
}

std::string InvalidValue(const std::string& key, std::size_t line_no) {
  return "invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error) {
  out_cfg = ClientConfig{};
  error.clear();
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "client_config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = ToLower(Trim(t.substr(1, t.size() - 2)));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    std::string key = Trim(t.substr(0, pos));
    std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    bool ok = true;
    if (section == "account") {
      if (key == "identifier" || key == "apple_id") {
        out_cfg.account.identifier = val;
      }
    } else if (section == "endpoints") {
      if (key == "china_mainland") {
        ok = ParseBool(val, out_cfg.endpoints.china_mainland);
      } else if (key == "auth") {
        out_cfg.endpoints.auth = val;
      } else if (key == "setup") {
        out_cfg.endpoints.setup = val;
      } else if (key == "home") {
        out_cfg.endpoints.home = val;
      }
    } else if (section == "session") {
      if (key == "cookie_directory") {
        out_cfg.session.cookie_directory = val;
      } else if (key == "client_id") {
        out_cfg.session.client_id = val;
      } else if (key == "accept_terms") {
        ok = ParseBool(val, out_cfg.session.accept_terms);
      } else if (key == "handshake_attempts") {
        ok = ParseUint32(val, out_cfg.session.handshake_attempts);
      }
    } else if (section == "network") {
      if (key == "timeout_ms") {
        ok = ParseUint32(val, out_cfg.network.timeout_ms);
      } else if (key == "connect_timeout_ms") {
        ok = ParseUint32(val, out_cfg.network.connect_timeout_ms);
      } else if (key == "verify_tls") {
        ok = ParseBool(val, out_cfg.network.verify_tls);
      } else if (key == "ca_bundle") {
        out_cfg.network.ca_bundle = val;
      } else if (key == "proxy") {
        out_cfg.network.proxy = val;
      } else if (key == "async_transport") {
        ok = ParseBool(val, out_cfg.network.async_transport);
      } else if (key == "treat_access_denied_as_retryable") {
        ok = ParseBool(val, out_cfg.network.treat_access_denied_as_retryable);
      }
    } else if (section == "consent") {
      if (key == "max_attempts") {
        ok = ParseUint32(val, out_cfg.consent.max_attempts);
      } else if (key == "interval_ms") {
        ok = ParseUint32(val, out_cfg.consent.interval_ms);
      }
    } else if (section == "log") {
      if (key == "level") {
        ok = ica::platform::log::ParseLevel(val, out_cfg.log.level);
      }
    }
    if (!ok) {
      error = InvalidValue(key, line_no);
      return false;
    }
  }

  if (out_cfg.network.timeout_ms == 0) {
    error = "timeout_ms must be positive";
    return false;
  }
  if (out_cfg.session.handshake_attempts == 0) {
    out_cfg.session.handshake_attempts = 1;
  }
  if (out_cfg.consent.max_attempts == 0) {
    error = "consent max_attempts must be positive";
    return false;
  }
  for (const auto* url : {&out_cfg.endpoints.auth, &out_cfg.endpoints.setup,
                          &out_cfg.endpoints.home}) {
    if (!url->empty() && !IsHttpsUrl(*url)) {
      error = "endpoint must be an https url: " + *url;
      return false;
    }
  }
  if (!out_cfg.session.client_id.empty() &&
      out_cfg.session.client_id.rfind("auth-", 0) != 0) {
    error = "client_id must start with auth-";
    return false;
  }
  return true;
}

}  // namespace ica::client
