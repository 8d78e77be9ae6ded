#ifndef ICA_CLIENT_HTTP_TRANSPORT_H
#define ICA_CLIENT_HTTP_TRANSPORT_H

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "cookie_jar.h"

namespace ica::client {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive header lookup. Returns the first match or empty.
std::string FindHeader(const HttpHeaders& headers, std::string_view name);
// Replaces an existing header of the same name or appends it.
void SetHeader(HttpHeaders& headers, std::string_view name, std::string value);

std::string UrlEncode(std::string_view text);
std::string BuildUrl(const std::string& base, const QueryParams& query);

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  QueryParams query;
  HttpHeaders headers;
  std::string body;
  std::uint32_t timeout_ms{30000};
};

struct HttpResponse {
  int status{0};
  std::string reason;
  HttpHeaders headers;
  std::string body;

  std::string Header(std::string_view name) const {
    return FindHeader(headers, name);
  }
  std::string content_type() const { return Header("Content-Type"); }
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // Performs one exchange. |cookies| supplies the request cookies and receives
  // whatever the server set. Returns false only when no response arrived.
  virtual bool Send(const HttpRequest& request, CookieJar& cookies,
                    HttpResponse& out, std::string& error) = 0;
};

struct CurlOptions {
  bool verify_tls{true};
  std::string ca_bundle;
  std::string proxy;
  std::string user_agent{"Mozilla/5.0 (X11; Linux x86_64) icloud_auth/1.0"};
  std::uint32_t connect_timeout_ms{10000};
};

// Blocking transport on a libcurl easy handle. One handle per instance,
// requests are serialized.
class CurlTransport : public HttpTransport {
 public:
  explicit CurlTransport(CurlOptions options = CurlOptions{});
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  bool Send(const HttpRequest& request, CookieJar& cookies, HttpResponse& out,
            std::string& error) override;

 private:
  CurlOptions options_;
  std::mutex mutex_;
  void* handle_{nullptr};
};

struct AsyncResult {
  bool ok{false};
  HttpResponse response;
  CookieJar cookies;
  std::string error;
};

// Runs an inner blocking transport on a worker thread. SendAsync hands back a
// future so the caller can overlap other work with the exchange.
//
// The blocking Send gives up after the request timeout plus |wait_grace_ms|.
// An exchange abandoned that way still owns the session: the next Send waits
// for it and folds its reply cookies into the caller's jar before going out.
class AsyncTransport : public HttpTransport {
 public:
  explicit AsyncTransport(std::unique_ptr<HttpTransport> inner,
                          std::uint32_t wait_grace_ms = 5000);
  ~AsyncTransport() override;

  AsyncTransport(const AsyncTransport&) = delete;
  AsyncTransport& operator=(const AsyncTransport&) = delete;

  std::future<AsyncResult> SendAsync(HttpRequest request, CookieJar cookies);

  bool Send(const HttpRequest& request, CookieJar& cookies, HttpResponse& out,
            std::string& error) override;

 private:
  struct Job {
    std::uint64_t id{0};
    HttpRequest request;
    CookieJar cookies;
    std::promise<AsyncResult> promise;
  };

  std::future<AsyncResult> Enqueue(std::unique_ptr<Job> job,
                                   std::uint64_t* queued_id);
  void WorkerLoop();

  std::unique_ptr<HttpTransport> inner_;
  const std::uint32_t wait_grace_ms_;
  // Serializes blocking Send calls; guards abandoned_.
  std::mutex send_mutex_;
  std::shared_future<AsyncResult> abandoned_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<Job>> jobs_;
  std::uint64_t next_job_id_{0};
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_HTTP_TRANSPORT_H
