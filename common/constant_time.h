#ifndef KSM_CONSTANT_TIME_H
#define KSM_CONSTANT_TIME_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ksm::common {

// Compares client ids and key text without an early exit. Inputs of
// different length are still walked to the end of the longer one.
inline bool ConstantTimeEqual(std::string_view lhs, std::string_view rhs) {
  const std::size_t span = lhs.size() < rhs.size() ? rhs.size() : lhs.size();
  std::uint8_t acc = lhs.size() == rhs.size() ? 0 : 1;
  for (std::size_t i = 0; i < span; ++i) {
    const auto l = i < lhs.size() ? static_cast<std::uint8_t>(lhs[i]) : 0u;
    const auto r = i < rhs.size() ? static_cast<std::uint8_t>(rhs[i]) : 0u;
    acc = static_cast<std::uint8_t>(acc | (l ^ r));
  }
  return acc == 0;
}

}  // namespace ksm::common

#endif  // KSM_CONSTANT_TIME_H
