#ifndef KSM_TRANSMISSION_KEY_H
#define KSM_TRANSMISSION_KEY_H

#include <cstdint>
#include <optional>
#include <vector>

#include "error.h"
#include "secure_buffer.h"
#include "server_keys.h"

namespace ksm::core {

// Ephemeral per-request key. Move-only; the raw key is wiped when the
// instance goes away.
struct TransmissionKey {
  std::uint32_t public_key_id{0};
  common::SecureBuffer key;
  std::vector<std::uint8_t> encrypted_key;
};

// Without an id the highest id in the table is used.
bool NewTransmissionKey(const ServerKeyTable& table,
                        std::optional<std::uint32_t> public_key_id,
                        TransmissionKey& out, Error& error);

}  // namespace ksm::core

#endif  // KSM_TRANSMISSION_KEY_H
