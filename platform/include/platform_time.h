#ifndef ICA_PLATFORM_TIME_H
#define ICA_PLATFORM_TIME_H

#include <cstdint>

namespace ica::platform {

std::uint64_t NowSteadyMs();
std::uint64_t NowUnixSeconds();
void SleepMs(std::uint32_t ms);

}  // namespace ica::platform

#endif  // ICA_PLATFORM_TIME_H
