#include <cstdint>
#include <iostream>
#include <string>

#include "cookie_jar.h"

namespace {

#define FAIL()                                                  \
  do {                                                          \
    std::cerr << "cookie_jar_test failed at " << __FILE__       \
              << ":" << __LINE__ << "\n";                       \
    return 1;                                                   \
  } while (false)

using ica::client::Cookie;
using ica::client::CookieJar;

}  // namespace

int main() {
  {
    Cookie cookie;
    const std::string line =
        "#HttpOnly_.icloud.com\tTRUE\t/\tTRUE\t1999999999\t"
        "X-APPLE-WEBAUTH-TOKEN\tv=2:t=abc";
    if (!CookieJar::ParseLine(line, cookie)) FAIL();
    if (!cookie.http_only || cookie.domain != ".icloud.com") FAIL();
    if (!cookie.include_subdomains || !cookie.secure) FAIL();
    if (cookie.expires != 1999999999) FAIL();
    if (cookie.name != "X-APPLE-WEBAUTH-TOKEN" || cookie.value != "v=2:t=abc") {
      FAIL();
    }
    if (CookieJar::FormatLine(cookie) != line) FAIL();
  }
  {
    // Empty value is allowed, a missing name is not.
    Cookie cookie;
    if (!CookieJar::ParseLine("a.com\tFALSE\t/\tFALSE\t0\tflag\t", cookie)) {
      FAIL();
    }
    if (!cookie.value.empty()) FAIL();
    if (CookieJar::ParseLine("a.com\tFALSE\t/\tFALSE\t0\t\tv", cookie)) FAIL();
    if (CookieJar::ParseLine("a.com\tMAYBE\t/\tFALSE\t0\tn\tv", cookie)) FAIL();
    if (CookieJar::ParseLine("a.com\tFALSE\t/\tFALSE\tsoon\tn\tv", cookie)) {
      FAIL();
    }
    if (CookieJar::ParseLine("a.com\tFALSE\t/", cookie)) FAIL();
    // An expiry past the 64-bit range is a corrupt line, not a wrapped value.
    if (CookieJar::ParseLine(
            ".icloud.com\tTRUE\t/\tTRUE\t99999999999999999999\t"
            "X-APPLE-WEBAUTH-TOKEN\tv",
            cookie)) FAIL();
    if (CookieJar::ParseLine("a.com\tFALSE\t/\tFALSE\t12x\tn\tv", cookie)) {
      FAIL();
    }
    if (!CookieJar::ParseLine("a.com\tFALSE\t/\tFALSE\t9223372036854775807\tn\tv",
                              cookie)) FAIL();
    if (cookie.expires != INT64_MAX) FAIL();
  }

  CookieJar jar;
  Cookie first;
  first.domain = ".icloud.com";
  first.name = "X-APPLE-WEBAUTH-USER";
  first.value = "one";
  jar.Set(first);
  first.value = "two";
  jar.Set(first);
  if (jar.size() != 1) FAIL();
  if (jar.Find("X-APPLE-WEBAUTH-USER")->value != "two") FAIL();

  Cookie other_path = first;
  other_path.path = "/setup";
  jar.Set(other_path);
  if (jar.size() != 2) FAIL();

  Cookie fmip;
  fmip.domain = ".icloud.com";
  fmip.name = ica::client::kDeviceTrackingCookie;
  fmip.value = "x";
  jar.Set(fmip);

  std::string err;
  CookieJar reparsed;
  if (!CookieJar::ParseNetscapeText(jar.ToNetscapeText(), reparsed, err)) FAIL();
  if (reparsed.size() != 3) FAIL();
  if (reparsed.Remove("X-APPLE-WEBAUTH-USER") != 2) FAIL();
  if (reparsed.size() != 1) FAIL();
  if (jar.ToNetscapeLines().size() != 3) FAIL();

  {
    CookieJar aging;
    Cookie gone;
    gone.domain = "a.com";
    gone.name = "gone";
    gone.expires = 100;
    aging.Set(gone);
    Cookie edge = gone;
    edge.name = "edge";
    edge.expires = 200;
    aging.Set(edge);
    Cookie session = gone;
    session.name = "session";
    session.expires = 0;
    aging.Set(session);
    if (aging.RemoveExpired(200) != 1) FAIL();
    if (aging.Find("gone") != nullptr) FAIL();
    if (aging.Find("edge") == nullptr || aging.Find("session") == nullptr) {
      FAIL();
    }
  }

  {
    CookieJar broken;
    const std::string text =
        "# Netscape HTTP Cookie File\r\n\r\n"
        "a.com\tFALSE\t/\tFALSE\t0\tok\tv\r\n"
        "garbage line\n";
    if (CookieJar::ParseNetscapeText(text, broken, err)) FAIL();
    if (!broken.empty()) FAIL();
    if (err.find("line 4") == std::string::npos) FAIL();
  }
  return 0;
}
