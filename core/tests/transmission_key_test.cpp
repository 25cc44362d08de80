#include <cassert>
#include <cstdint>
#include <optional>
#include <vector>

#include "crypto.h"
#include "server_keys.h"
#include "transmission_key.h"

using ksm::core::Error;
using ksm::core::ErrorCode;
using ksm::core::NewTransmissionKey;
using ksm::core::ServerKeyTable;
using ksm::core::TransmissionKey;
namespace crypto = ksm::core::crypto;

int main() {
  const ServerKeyTable& production = ServerKeyTable::Production();
  assert(production.size() == 11);
  assert(production.Contains(7));
  assert(production.Contains(17));
  assert(!production.Contains(6));
  assert(production.HighestId() == 17);
  assert(ServerKeyTable().HighestId() == 0);

  crypto::EcKeyPair server_a;
  crypto::EcKeyPair server_b;
  Error error;
  assert(crypto::GenerateEcKeyPair(server_a, error));
  assert(crypto::GenerateEcKeyPair(server_b, error));
  ServerKeyTable::KeyMap keys;
  keys.emplace(3, server_a.public_key);
  keys.emplace(5, server_b.public_key);
  const ServerKeyTable table(1, std::move(keys));

  TransmissionKey latest;
  assert(NewTransmissionKey(table, std::nullopt, latest, error));
  assert(latest.public_key_id == 5);
  assert(latest.key.size() == crypto::kAesKeyBytes);

  // Only the holder of the matching server key recovers the raw key.
  std::vector<std::uint8_t> unwrapped;
  assert(crypto::PrivateDecrypt(latest.encrypted_key, server_b.private_der,
                                {}, unwrapped, error));
  assert(unwrapped == latest.key.bytes());
  unwrapped.clear();
  assert(!crypto::PrivateDecrypt(latest.encrypted_key, server_a.private_der,
                                 {}, unwrapped, error));
  error.Clear();

  TransmissionKey pinned;
  assert(NewTransmissionKey(table, 3u, pinned, error));
  assert(pinned.public_key_id == 3);
  assert(crypto::PrivateDecrypt(pinned.encrypted_key, server_a.private_der,
                                {}, unwrapped, error));
  assert(unwrapped == pinned.key.bytes());

  TransmissionKey second;
  assert(NewTransmissionKey(table, 3u, second, error));
  assert(second.key.bytes() != pinned.key.bytes());

  TransmissionKey unknown;
  assert(!NewTransmissionKey(table, 4u, unknown, error));
  assert(error.code == ErrorCode::kUnknownServerKey);
  assert(unknown.key.empty());

  error.Clear();
  assert(!NewTransmissionKey(ServerKeyTable(), std::nullopt, unknown, error));
  assert(error.code == ErrorCode::kUnknownServerKey);
  return 0;
}
