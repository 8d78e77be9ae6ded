#include "http_transport.h"

#include <chrono>
#include <utility>

namespace ica::client {

AsyncTransport::AsyncTransport(std::unique_ptr<HttpTransport> inner,
                               std::uint32_t wait_grace_ms)
    : inner_(std::move(inner)), wait_grace_ms_(wait_grace_ms) {
  worker_ = std::thread([this] { WorkerLoop(); });
}

AsyncTransport::~AsyncTransport() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::future<AsyncResult> AsyncTransport::Enqueue(std::unique_ptr<Job> job,
                                                 std::uint64_t* queued_id) {
  std::future<AsyncResult> future = job->promise.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !inner_) {
      AsyncResult result;
      result.error = "transport stopped";
      job->promise.set_value(std::move(result));
      return future;
    }
    job->id = ++next_job_id_;
    if (queued_id != nullptr) {
      *queued_id = job->id;
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return future;
}

std::future<AsyncResult> AsyncTransport::SendAsync(HttpRequest request,
                                                   CookieJar cookies) {
  auto job = std::make_unique<Job>();
  job->request = std::move(request);
  job->cookies = std::move(cookies);
  return Enqueue(std::move(job), nullptr);
}

bool AsyncTransport::Send(const HttpRequest& request, CookieJar& cookies,
                          HttpResponse& out, std::string& error) {
  std::lock_guard<std::mutex> send_lock(send_mutex_);
  if (abandoned_.valid()) {
    // The inner transport bounds every exchange, so this wait ends.
    const AsyncResult& previous = abandoned_.get();
    if (previous.ok) {
      for (const auto& cookie : previous.cookies.cookies()) {
        cookies.Set(cookie);
      }
    }
    abandoned_ = std::shared_future<AsyncResult>();
  }

  auto job = std::make_unique<Job>();
  job->request = request;
  job->cookies = cookies;
  std::uint64_t queued_id = 0;
  std::future<AsyncResult> future = Enqueue(std::move(job), &queued_id);
  const auto wait = std::chrono::milliseconds(
      static_cast<std::int64_t>(request.timeout_ms) + wait_grace_ms_);
  if (future.wait_for(wait) != std::future_status::ready) {
    bool dequeued = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if ((*it)->id == queued_id) {
          jobs_.erase(it);
          dequeued = true;
          break;
        }
      }
    }
    if (!dequeued) {
      abandoned_ = future.share();
    }
    error = "request timed out";
    return false;
  }
  AsyncResult result = future.get();
  if (!result.ok) {
    error = std::move(result.error);
    return false;
  }
  cookies = std::move(result.cookies);
  out = std::move(result.response);
  error.clear();
  return true;
}

void AsyncTransport::WorkerLoop() {
  while (true) {
    std::unique_ptr<Job> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    AsyncResult result;
    result.cookies = std::move(job->cookies);
    result.ok = inner_->Send(job->request, result.cookies, result.response,
                             result.error);
    job->promise.set_value(std::move(result));
  }
}

}  // namespace ica::client
