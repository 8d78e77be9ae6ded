#ifndef ICA_CLIENT_SESSION_H
#define ICA_CLIENT_SESSION_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "auth_error.h"
#include "endpoints.h"
#include "http_transport.h"
#include "session_state.h"
#include "session_store.h"

namespace ica::client {

// Session interface shared by the authentication components. Whether a
// request blocks the calling thread or runs on a worker depends only on the
// transport the session was built with.
class Session {
 public:
  virtual ~Session() = default;

  virtual void Load() = 0;
  virtual bool Save(std::string& error) = 0;
  // Returns false when the classified outcome is an error. |out| holds the
  // response whenever one was received, error or not.
  virtual bool Request(const HttpRequest& request, HttpResponse& out,
                       ClassifiedError& error) = 0;
};

struct SessionOptions {
  std::uint32_t timeout_ms{30000};
  ClassifierPolicy classifier;
};

// Owns the session state and its store. Every response runs through the same
// path: adopt cookies, merge tracked headers, persist, classify.
class AuthSession : public Session {
 public:
  AuthSession(std::unique_ptr<HttpTransport> transport, SessionStore store,
              Endpoints endpoints, SessionOptions options = SessionOptions{});

  AuthSession(const AuthSession&) = delete;
  AuthSession& operator=(const AuthSession&) = delete;

  void Load() override;
  bool Save(std::string& error) override;
  bool Request(const HttpRequest& request, HttpResponse& out,
               ClassifiedError& error) override;

  std::string Value(std::string_view key) const;
  bool HasValue(std::string_view key) const;
  bool HasCookie(std::string_view name) const;
  SessionState Snapshot() const;
  void MergeValues(const SessionValues& values);
  // Clears memory and disk.
  bool Reset(std::string& error);

  // Headers expected by the auth endpoint, including the echoed scnt and
  // session id once known.
  HttpHeaders AuthHeaders() const;
  // Origin and Referer for setup endpoint calls.
  HttpHeaders WebHeaders() const;

  void set_second_factor_outstanding(bool value);
  const Endpoints& endpoints() const { return endpoints_; }
  std::uint32_t timeout_ms() const { return options_.timeout_ms; }
  const SessionStore& store() const { return store_; }

 private:
  std::unique_ptr<HttpTransport> transport_;
  SessionStore store_;
  Endpoints endpoints_;
  SessionOptions options_;
  ErrorClassifier classifier_;

  // One exchange in flight per session.
  std::mutex request_mutex_;
  mutable std::mutex mutex_;
  SessionState state_;
  bool second_factor_outstanding_{false};
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SESSION_H
