#include "transmission_key.h"

#include <string>

#include "crypto.h"
#include "platform_random.h"

namespace ksm::core {

bool NewTransmissionKey(const ServerKeyTable& table,
                        std::optional<std::uint32_t> public_key_id,
                        TransmissionKey& out, Error& error) {
  const std::uint32_t id =
      public_key_id.has_value() ? *public_key_id : table.HighestId();
  const std::vector<std::uint8_t>* server_key = table.Find(id);
  if (!server_key) {
    return Fail(error, ErrorCode::kUnknownServerKey,
                "server public key " + std::to_string(id) +
                    " is not pinned");
  }

  std::vector<std::uint8_t> raw;
  common::ScopedWipe wipe_raw(raw);
  if (!platform::RandomBytes(crypto::kAesKeyBytes, raw)) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  std::vector<std::uint8_t> wrapped;
  if (!crypto::PublicEncrypt(raw, *server_key, {}, wrapped, error)) {
    return false;
  }

  out.public_key_id = id;
  out.key.assign(raw.data(), raw.size());
  out.encrypted_key = std::move(wrapped);
  return true;
}

}  // namespace ksm::core
