#ifndef ICA_CLIENT_COOKIE_JAR_H
#define ICA_CLIENT_COOKIE_JAR_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ica::client {

constexpr char kWebAuthTokenCookie[] = "X-APPLE-WEBAUTH-TOKEN";
// Device-tracking cookie; never restored from disk.
constexpr char kDeviceTrackingCookie[] = "X-APPLE-WEBAUTH-FMIP";

struct Cookie {
  std::string domain;
  bool include_subdomains{false};
  std::string path{"/"};
  bool secure{false};
  std::int64_t expires{0};
  std::string name;
  std::string value;
  bool http_only{false};
};

// In-memory cookie store serialized in the Netscape cookie-file format, the
// same line format libcurl reads and writes.
class CookieJar {
 public:
  // Replaces any cookie with the same domain, path and name.
  void Set(Cookie cookie);
  const Cookie* Find(std::string_view name) const;
  std::size_t Remove(std::string_view name);
  // Drops persistent cookies that expired before |now|. Session cookies
  // (expires == 0) stay.
  std::size_t RemoveExpired(std::int64_t now);
  void Clear() { cookies_.clear(); }

  bool empty() const { return cookies_.empty(); }
  std::size_t size() const { return cookies_.size(); }
  const std::vector<Cookie>& cookies() const { return cookies_; }

  std::string ToNetscapeText() const;
  std::vector<std::string> ToNetscapeLines() const;

  static std::string FormatLine(const Cookie& cookie);
  static bool ParseLine(std::string_view line, Cookie& out);
  // Skips comments and blank lines. Fails on the first malformed entry.
  static bool ParseNetscapeText(std::string_view text, CookieJar& out,
                                std::string& error);

 private:
  std::vector<Cookie> cookies_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_COOKIE_JAR_H
