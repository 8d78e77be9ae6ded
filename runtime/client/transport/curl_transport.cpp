#include "http_transport.h"

#include <curl/curl.h>

#include <array>
#include <cctype>
#include <mutex>
#include <string>

#include "platform_log.h"

namespace ica::client {

namespace plog = ica::platform::log;

namespace {

std::once_flag g_curl_init_once;

struct ResponseSink {
  HttpResponse* response{nullptr};
};

std::string TrimAscii(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::size_t WriteBody(char* ptr, std::size_t size, std::size_t nmemb,
                      void* user) {
  auto* sink = static_cast<ResponseSink*>(user);
  const std::size_t len = size * nmemb;
  sink->response->body.append(ptr, len);
  return len;
}

std::size_t WriteHeader(char* ptr, std::size_t size, std::size_t nmemb,
                        void* user) {
  auto* sink = static_cast<ResponseSink*>(user);
  const std::size_t len = size * nmemb;
  const std::string_view line(ptr, len);
  if (line.substr(0, 5) == "HTTP/") {
    // New status line: interim responses and redirects restart collection.
    sink->response->headers.clear();
    sink->response->reason.clear();
    const std::size_t first = line.find(' ');
    if (first != std::string_view::npos) {
      const std::size_t second = line.find(' ', first + 1);
      if (second != std::string_view::npos) {
        sink->response->reason = TrimAscii(line.substr(second + 1));
      }
    }
    return len;
  }
  const std::size_t colon = line.find(':');
  if (colon == std::string_view::npos) {
    return len;
  }
  sink->response->headers.emplace_back(TrimAscii(line.substr(0, colon)),
                                       TrimAscii(line.substr(colon + 1)));
  return len;
}

class HeaderList {
 public:
  HeaderList() = default;
  ~HeaderList() {
    if (list_) {
      curl_slist_free_all(list_);
    }
  }
  HeaderList(const HeaderList&) = delete;
  HeaderList& operator=(const HeaderList&) = delete;

  bool Append(const std::string& line) {
    curl_slist* next = curl_slist_append(list_, line.c_str());
    if (!next) {
      return false;
    }
    list_ = next;
    return true;
  }
  curl_slist* get() const { return list_; }

 private:
  curl_slist* list_{nullptr};
};

}  // namespace

CurlTransport::CurlTransport(CurlOptions options)
    : options_(std::move(options)) {
  std::call_once(g_curl_init_once,
                 [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
}

CurlTransport::~CurlTransport() {
  if (handle_) {
    curl_easy_cleanup(static_cast<CURL*>(handle_));
    handle_ = nullptr;
  }
}

bool CurlTransport::Send(const HttpRequest& request, CookieJar& cookies,
                         HttpResponse& out, std::string& error) {
  error.clear();
  out = HttpResponse{};
  std::lock_guard<std::mutex> lock(mutex_);
  CURL* curl = static_cast<CURL*>(handle_);
  if (!curl) {
    error = "curl init failed";
    return false;
  }
  curl_easy_reset(curl);

  HeaderList headers;
  for (const auto& kv : request.headers) {
    if (!headers.Append(kv.first + ": " + kv.second)) {
      error = "header list allocation failed";
      return false;
    }
  }
  // Suppress the default "Expect: 100-continue" on POST bodies.
  if (!headers.Append("Expect:")) {
    error = "header list allocation failed";
    return false;
  }

  const std::string url = BuildUrl(request.url, request.query);
  std::array<char, CURL_ERROR_SIZE> error_buf{};
  ResponseSink sink{&out};

  CURLcode rc = CURLE_OK;
  auto set = [&](CURLcode code) {
    if (rc == CURLE_OK) {
      rc = code;
    }
  };
  set(curl_easy_setopt(curl, CURLOPT_URL, url.c_str()));
  set(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get()));
  set(curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf.data()));
  set(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteBody));
  set(curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink));
  set(curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &WriteHeader));
  set(curl_easy_setopt(curl, CURLOPT_HEADERDATA, &sink));
  set(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L));
  set(curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                       static_cast<long>(request.timeout_ms)));
  set(curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                       static_cast<long>(options_.connect_timeout_ms)));
  set(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER,
                       options_.verify_tls ? 1L : 0L));
  set(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST,
                       options_.verify_tls ? 2L : 0L));
  if (!options_.ca_bundle.empty()) {
    set(curl_easy_setopt(curl, CURLOPT_CAINFO, options_.ca_bundle.c_str()));
  }
  if (!options_.proxy.empty()) {
    set(curl_easy_setopt(curl, CURLOPT_PROXY, options_.proxy.c_str()));
  }
  if (!options_.user_agent.empty()) {
    set(curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str()));
  }

  if (request.method == "POST") {
    set(curl_easy_setopt(curl, CURLOPT_POST, 1L));
  } else if (request.method != "GET") {
    set(curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str()));
  }
  if (request.method != "GET") {
    set(curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size())));
    set(curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str()));
  }

  // Cookie engine: start empty, then load exactly the jar for this request.
  set(curl_easy_setopt(curl, CURLOPT_COOKIEFILE, ""));
  set(curl_easy_setopt(curl, CURLOPT_COOKIELIST, "ALL"));
  for (const auto& line : cookies.ToNetscapeLines()) {
    set(curl_easy_setopt(curl, CURLOPT_COOKIELIST, line.c_str()));
  }
  if (rc != CURLE_OK) {
    error = std::string("curl setup failed: ") + curl_easy_strerror(rc);
    return false;
  }

  plog::Log(plog::Level::kDebug, "http", "request",
            {{"method", request.method}, {"url", request.url}});
  rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    error = error_buf[0] != '\0' ? std::string(error_buf.data())
                                 : std::string(curl_easy_strerror(rc));
    plog::Log(plog::Level::kWarn, "http", "transfer failed",
              {{"url", request.url}, {"error", error}});
    return false;
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  out.status = static_cast<int>(status);

  curl_slist* cookie_list = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_COOKIELIST, &cookie_list) == CURLE_OK) {
    CookieJar updated;
    for (curl_slist* it = cookie_list; it; it = it->next) {
      Cookie cookie;
      if (it->data && CookieJar::ParseLine(it->data, cookie)) {
        updated.Set(std::move(cookie));
      }
    }
    curl_slist_free_all(cookie_list);
    cookies = std::move(updated);
  }
  plog::Log(plog::Level::kDebug, "http", "response",
            {{"status", std::to_string(out.status)}, {"url", request.url}});
  return true;
}

}  // namespace ica::client
