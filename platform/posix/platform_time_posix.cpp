#include "platform_time.h"

#include <time.h>

#include <cerrno>

namespace ica::platform {

std::uint64_t NowSteadyMs() {
  timespec ts{};
  if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000u +
         static_cast<std::uint64_t>(ts.tv_nsec / 1000000);
}

std::uint64_t NowUnixSeconds() {
  const time_t now = ::time(nullptr);
  return now <= 0 ? 0 : static_cast<std::uint64_t>(now);
}

void SleepMs(std::uint32_t ms) {
  timespec req{};
  req.tv_sec = static_cast<time_t>(ms / 1000);
  req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
  timespec rem{};
  while (nanosleep(&req, &rem) != 0 && errno == EINTR) {
    req = rem;
  }
}

}  // namespace ica::platform
