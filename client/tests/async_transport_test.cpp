#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_transport.h"
#include "http_transport.h"

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "async_transport_test failed at " << __FILE__        \
              << ":" << __LINE__ << "\n";                             \
    return 1;                                                         \
  } while (false)

using ica::client::AsyncResult;
using ica::client::AsyncTransport;
using ica::client::CookieJar;
using ica::client::HttpRequest;
using ica::client::HttpResponse;
namespace t = ica::client::testing;

HttpRequest Get(const std::string& url) {
  HttpRequest request;
  request.url = url;
  request.timeout_ms = 1000;
  return request;
}

// Holds requests to /slow well past their timeout.
class SlowTransport : public ica::client::HttpTransport {
 public:
  explicit SlowTransport(t::FakeTransport* fake) : fake_(fake) {}

  bool Send(const HttpRequest& request, CookieJar& cookies, HttpResponse& out,
            std::string& error) override {
    if (request.url == "https://a.test/slow") {
      std::this_thread::sleep_for(std::chrono::milliseconds(400));
    }
    return fake_->Send(request, cookies, out, error);
  }

 private:
  t::FakeTransport* fake_;
};

}  // namespace

int main() {
  if (ica::client::BuildUrl("https://a.test/x", {{"k", "a b&c"}, {"n", "1"}}) !=
      "https://a.test/x?k=a%20b%26c&n=1") FAIL();
  if (ica::client::BuildUrl("https://a.test/x?y=1", {{"z", "2"}}) !=
      "https://a.test/x?y=1&z=2") FAIL();

  auto inner = std::make_unique<t::FakeTransport>();
  t::FakeTransport* fake = inner.get();
  ica::client::Cookie cookie = t::WebAuthCookie("issued");
  t::ScriptedReply with_cookie = t::JsonReply(200, "{\"n\":1}");
  with_cookie.set_cookies.push_back(cookie);
  fake->Script("GET", "https://a.test/one", with_cookie);
  fake->Script("GET", "https://a.test/two", t::JsonReply(201, "{\"n\":2}"));
  fake->Script("GET", "https://a.test/down", t::NetworkFailure("refused"));

  {
    AsyncTransport transport(std::move(inner));

    std::future<AsyncResult> first =
        transport.SendAsync(Get("https://a.test/one"), CookieJar{});
    std::future<AsyncResult> second =
        transport.SendAsync(Get("https://a.test/two"), CookieJar{});
    std::future<AsyncResult> third =
        transport.SendAsync(Get("https://a.test/down"), CookieJar{});

    if (first.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
      FAIL();
    }
    AsyncResult r1 = first.get();
    if (!r1.ok || r1.response.body != "{\"n\":1}") FAIL();
    if (r1.cookies.Find(ica::client::kWebAuthTokenCookie) == nullptr) FAIL();

    AsyncResult r2 = second.get();
    if (!r2.ok || r2.response.status != 201) FAIL();
    AsyncResult r3 = third.get();
    if (r3.ok || r3.error != "refused") FAIL();

    // The blocking form hands the cookies back to the caller.
    CookieJar jar;
    HttpResponse out;
    std::string err;
    if (!transport.Send(Get("https://a.test/one"), jar, out, err)) FAIL();
    if (jar.Find(ica::client::kWebAuthTokenCookie) == nullptr) FAIL();
    if (transport.Send(Get("https://a.test/down"), jar, out, err)) FAIL();
    if (err != "refused") FAIL();

    // Requests ran in submission order on the worker.
    const auto& recorded = fake->recorded();
    if (recorded.size() != 5) FAIL();
    if (recorded[0].request.url != "https://a.test/one" ||
        recorded[1].request.url != "https://a.test/two" ||
        recorded[2].request.url != "https://a.test/down") FAIL();
  }

  {
    // A timed-out exchange finishes before the next one goes out, and its
    // cookies reach the caller.
    t::FakeTransport fake_backend;
    t::ScriptedReply late = t::JsonReply(200, "{}");
    late.set_cookies.push_back(t::WebAuthCookie("late"));
    fake_backend.Script("GET", "https://a.test/slow", late);
    fake_backend.Script("GET", "https://a.test/next", t::JsonReply(200, "{}"));
    AsyncTransport transport(std::make_unique<SlowTransport>(&fake_backend), 0);

    HttpRequest slow = Get("https://a.test/slow");
    slow.timeout_ms = 50;
    CookieJar jar;
    HttpResponse out;
    std::string err;
    if (transport.Send(slow, jar, out, err)) FAIL();
    if (err != "request timed out") FAIL();
    if (!jar.empty()) FAIL();

    if (!transport.Send(Get("https://a.test/next"), jar, out, err)) FAIL();
    const auto& recorded = fake_backend.recorded();
    if (recorded.size() != 2) FAIL();
    if (recorded[0].request.url != "https://a.test/slow") FAIL();
    if (recorded[1].request.url != "https://a.test/next") FAIL();
    const ica::client::Cookie* carried =
        recorded[1].cookies.Find(ica::client::kWebAuthTokenCookie);
    if (carried == nullptr || carried->value != "late") FAIL();
    const ica::client::Cookie* kept =
        jar.Find(ica::client::kWebAuthTokenCookie);
    if (kept == nullptr || kept->value != "late") FAIL();
  }

  {
    // A session built on the worker transport behaves like a blocking one.
    auto worker_inner = std::make_unique<t::FakeTransport>();
    t::FakeTransport* worker_fake = worker_inner.get();
    worker_fake->Script("POST", std::string(t::kSetup) + "/validate",
                        t::JsonReply(200, "{}", {{"scnt", "s-9"}}));
    const auto dir = t::MakeTempDir("ica_async_transport_test");
    ica::client::AuthSession session(
        std::make_unique<AsyncTransport>(std::move(worker_inner)),
        ica::client::SessionStore(dir, "user"), t::TestEndpoints());
    HttpRequest request;
    request.method = "POST";
    request.url = std::string(t::kSetup) + "/validate";
    HttpResponse response;
    ica::client::ClassifiedError err;
    if (!session.Request(request, response, err)) FAIL();
    if (session.Value(ica::client::session_keys::kScnt) != "s-9") FAIL();
  }
  return 0;
}
