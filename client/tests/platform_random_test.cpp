#include <array>
#include <cstdint>
#include <iostream>
#include <string>

#include "platform_random.h"

namespace {

#define FAIL()                                                     \
  do {                                                             \
    std::cerr << "platform_random_test failed at " << __FILE__     \
              << ":" << __LINE__ << "\n";                          \
    return 1;                                                      \
  } while (false)

bool IsLowerHex(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

}  // namespace

int main() {
  std::array<std::uint8_t, 64> first{};
  std::array<std::uint8_t, 64> second{};
  if (!ica::platform::RandomBytes(first.data(), first.size())) FAIL();
  if (!ica::platform::RandomBytes(second.data(), second.size())) FAIL();
  if (first == second) FAIL();
  if (ica::platform::RandomBytes(nullptr, 8)) FAIL();
  if (ica::platform::RandomBytes(first.data(), 0)) FAIL();

  const std::string uuid = ica::platform::RandomUuid();
  if (uuid.size() != 36) FAIL();
  for (std::size_t i = 0; i < uuid.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (uuid[i] != '-') FAIL();
    } else if (!IsLowerHex(uuid[i])) {
      FAIL();
    }
  }
  if (uuid[14] != '4') FAIL();
  if (uuid[19] != '8' && uuid[19] != '9' && uuid[19] != 'a' && uuid[19] != 'b') {
    FAIL();
  }
  if (ica::platform::RandomUuid() == uuid) FAIL();
  return 0;
}
