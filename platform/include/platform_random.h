#ifndef ICA_PLATFORM_RANDOM_H
#define ICA_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace ica::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);
// Lowercase RFC 4122 version 4 UUID text, empty on RNG failure.
std::string RandomUuid();

}  // namespace ica::platform

#endif  // ICA_PLATFORM_RANDOM_H
