#include "http_transport.h"

#include <cctype>

namespace ica::client {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string FindHeader(const HttpHeaders& headers, std::string_view name) {
  for (const auto& kv : headers) {
    if (EqualsIgnoreCase(kv.first, name)) {
      return kv.second;
    }
  }
  return {};
}

void SetHeader(HttpHeaders& headers, std::string_view name, std::string value) {
  for (auto& kv : headers) {
    if (EqualsIgnoreCase(kv.first, name)) {
      kv.second = std::move(value);
      return;
    }
  }
  headers.emplace_back(std::string(name), std::move(value));
}

std::string UrlEncode(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (const char ch : text) {
    const unsigned char uc = static_cast<unsigned char>(ch);
    if (std::isalnum(uc) != 0 || ch == '-' || ch == '_' || ch == '.' ||
        ch == '~') {
      out.push_back(ch);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[uc >> 4]);
    out.push_back(kHex[uc & 0x0F]);
  }
  return out;
}

std::string BuildUrl(const std::string& base, const QueryParams& query) {
  if (query.empty()) {
    return base;
  }
  std::string url = base;
  char sep = base.find('?') == std::string::npos ? '?' : '&';
  for (const auto& kv : query) {
    url.push_back(sep);
    url.append(UrlEncode(kv.first));
    url.push_back('=');
    url.append(UrlEncode(kv.second));
    sep = '&';
  }
  return url;
}

}  // namespace ica::client
