#ifndef KSM_ENCODING_UTILS_H
#define KSM_ENCODING_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ksm::common {

std::string Base64Encode(const std::uint8_t* data, std::size_t len);
std::string Base64Encode(const std::vector<std::uint8_t>& data);

// Url-safe alphabet, no padding.
std::string Base64UrlEncode(const std::uint8_t* data, std::size_t len);
std::string Base64UrlEncode(const std::vector<std::uint8_t>& data);

// Accepts both the standard and url-safe alphabets, padded or not.
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

inline std::vector<std::uint8_t> StringToBytes(std::string_view text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

inline std::string BytesToString(const std::vector<std::uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace ksm::common

#endif  // KSM_ENCODING_UTILS_H
