#include "cookie_jar.h"

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

namespace ica::client {

namespace {

constexpr std::string_view kHttpOnlyPrefix = "#HttpOnly_";
constexpr char kHeaderLine[] = "# Netscape HTTP Cookie File";

bool ParseFlag(std::string_view text, bool& out) {
  if (text == "TRUE") {
    out = true;
    return true;
  }
  if (text == "FALSE") {
    out = false;
    return true;
  }
  return false;
}

// Rejects anything from_chars does not consume entirely, overflow included.
bool ParseInt64(std::string_view text, std::int64_t& out) {
  if (text.empty()) {
    return false;
  }
  std::int64_t value = 0;
  const char* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value);
  if (result.ec != std::errc() || result.ptr != end) {
    return false;
  }
  out = value;
  return true;
}

std::string_view StripLineEnding(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

void CookieJar::Set(Cookie cookie) {
  for (auto& existing : cookies_) {
    if (existing.name == cookie.name && existing.domain == cookie.domain &&
        existing.path == cookie.path) {
      existing = std::move(cookie);
      return;
    }
  }
  cookies_.push_back(std::move(cookie));
}

const Cookie* CookieJar::Find(std::string_view name) const {
  for (const auto& cookie : cookies_) {
    if (cookie.name == name) {
      return &cookie;
    }
  }
  return nullptr;
}

std::size_t CookieJar::Remove(std::string_view name) {
  const std::size_t before = cookies_.size();
  std::vector<Cookie> kept;
  kept.reserve(cookies_.size());
  for (auto& cookie : cookies_) {
    if (cookie.name != name) {
      kept.push_back(std::move(cookie));
    }
  }
  cookies_.swap(kept);
  return before - cookies_.size();
}

std::size_t CookieJar::RemoveExpired(std::int64_t now) {
  const std::size_t before = cookies_.size();
  std::vector<Cookie> kept;
  kept.reserve(cookies_.size());
  for (auto& cookie : cookies_) {
    if (cookie.expires == 0 || cookie.expires >= now) {
      kept.push_back(std::move(cookie));
    }
  }
  cookies_.swap(kept);
  return before - cookies_.size();
}

std::string CookieJar::FormatLine(const Cookie& cookie) {
  std::string line;
  if (cookie.http_only) {
    line.append(kHttpOnlyPrefix);
  }
  line.append(cookie.domain);
  line.push_back('\t');
  line.append(cookie.include_subdomains ? "TRUE" : "FALSE");
  line.push_back('\t');
  line.append(cookie.path.empty() ? "/" : cookie.path);
  line.push_back('\t');
  line.append(cookie.secure ? "TRUE" : "FALSE");
  line.push_back('\t');
  line.append(std::to_string(cookie.expires));
  line.push_back('\t');
  line.append(cookie.name);
  line.push_back('\t');
  line.append(cookie.value);
  return line;
}

bool CookieJar::ParseLine(std::string_view line, Cookie& out) {
  out = Cookie{};
  line = StripLineEnding(line);
  if (line.substr(0, kHttpOnlyPrefix.size()) == kHttpOnlyPrefix) {
    out.http_only = true;
    line.remove_prefix(kHttpOnlyPrefix.size());
  }
  std::string_view fields[7];
  std::size_t count = 0;
  while (count < 6) {
    const std::size_t tab = line.find('\t');
    if (tab == std::string_view::npos) {
      return false;
    }
    fields[count++] = line.substr(0, tab);
    line.remove_prefix(tab + 1);
  }
  // The value is the remainder and may legitimately be empty.
  fields[count] = line;

  if (fields[0].empty() || fields[5].empty()) {
    return false;
  }
  out.domain = std::string(fields[0]);
  if (!ParseFlag(fields[1], out.include_subdomains)) {
    return false;
  }
  out.path = std::string(fields[2]);
  if (!ParseFlag(fields[3], out.secure)) {
    return false;
  }
  if (!ParseInt64(fields[4], out.expires)) {
    return false;
  }
  out.name = std::string(fields[5]);
  out.value = std::string(fields[6]);
  return true;
}

std::vector<std::string> CookieJar::ToNetscapeLines() const {
  std::vector<std::string> lines;
  lines.reserve(cookies_.size());
  for (const auto& cookie : cookies_) {
    lines.push_back(FormatLine(cookie));
  }
  return lines;
}

std::string CookieJar::ToNetscapeText() const {
  std::string out = kHeaderLine;
  out.append("\n\n");
  for (const auto& cookie : cookies_) {
    out.append(FormatLine(cookie));
    out.push_back('\n');
  }
  return out;
}

bool CookieJar::ParseNetscapeText(std::string_view text, CookieJar& out,
                                  std::string& error) {
  error.clear();
  out.Clear();
  std::size_t line_no = 0;
  while (!text.empty()) {
    ++line_no;
    const std::size_t nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    line = StripLineEnding(line);
    if (line.empty()) {
      continue;
    }
    if (line[0] == '#' &&
        line.substr(0, kHttpOnlyPrefix.size()) != kHttpOnlyPrefix) {
      continue;
    }
    Cookie cookie;
    if (!ParseLine(line, cookie)) {
      out.Clear();
      error = "malformed cookie entry at line " + std::to_string(line_no);
      return false;
    }
    out.Set(std::move(cookie));
  }
  return true;
}

}  // namespace ica::client
