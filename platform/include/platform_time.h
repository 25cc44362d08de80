#ifndef KSM_PLATFORM_TIME_H
#define KSM_PLATFORM_TIME_H

#include <cstdint>

namespace ksm::platform {

std::uint64_t NowSteadyMs();
// Wall clock, milliseconds since the Unix epoch.
std::uint64_t NowUnixMs();
void SleepMs(std::uint32_t ms);

}  // namespace ksm::platform

#endif  // KSM_PLATFORM_TIME_H
