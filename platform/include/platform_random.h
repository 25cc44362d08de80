#ifndef KSM_PLATFORM_RANDOM_H
#define KSM_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ksm::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);
bool RandomBytes(std::size_t len, std::vector<std::uint8_t>& out);

}  // namespace ksm::platform

#endif  // KSM_PLATFORM_RANDOM_H
