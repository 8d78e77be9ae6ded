#include "platform_random.h"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace ica::platform {

namespace {

bool OsRandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
  std::size_t done = 0;
#if defined(__linux__)
  while (done < len) {
    const ssize_t got = getrandom(out + done, len - done, 0);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  if (done == len) {
    return true;
  }
#endif

  int fd = ::open("/dev/urandom", O_RDONLY);
  if (fd < 0) {
    return false;
  }
  done = 0;
  while (done < len) {
    const ssize_t got = ::read(fd, out + done, len - done);
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  ::close(fd);
  return done == len;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  return OsRandomBytes(out, len);
}

std::string RandomUuid() {
  std::array<std::uint8_t, 16> b{};
  if (!RandomBytes(b.data(), b.size())) {
    return {};
  }
  b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
  b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);
  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9],
                b[10], b[11], b[12], b[13], b[14], b[15]);
  return std::string(buf, 36);
}

}  // namespace ica::platform
