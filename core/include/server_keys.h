#ifndef KSM_SERVER_KEYS_H
#define KSM_SERVER_KEYS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace ksm::core {

// Immutable id -> P-256 public key table. The production table is built
// once on first use; tests construct their own and hand it to the client.
class ServerKeyTable {
 public:
  using KeyMap = std::map<std::uint32_t, std::vector<std::uint8_t>>;

  ServerKeyTable() = default;
  ServerKeyTable(std::uint32_t version, KeyMap keys)
      : version_(version), keys_(std::move(keys)) {}

  static const ServerKeyTable& Production();

  const std::vector<std::uint8_t>* Find(std::uint32_t id) const;
  bool Contains(std::uint32_t id) const { return Find(id) != nullptr; }
  // Zero when the table is empty.
  std::uint32_t HighestId() const;

  std::uint32_t version() const { return version_; }
  std::size_t size() const { return keys_.size(); }
  bool empty() const { return keys_.empty(); }

 private:
  std::uint32_t version_{0};
  KeyMap keys_;
};

}  // namespace ksm::core

#endif  // KSM_SERVER_KEYS_H
