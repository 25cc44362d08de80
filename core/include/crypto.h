#ifndef KSM_CRYPTO_H
#define KSM_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.h"
#include "secure_buffer.h"

namespace ksm::core::crypto {

constexpr std::size_t kAesKeyBytes = 32;
constexpr std::size_t kGcmIvBytes = 12;
constexpr std::size_t kGcmTagBytes = 16;
// X9.62 uncompressed P-256 point: 0x04 || X || Y.
constexpr std::size_t kEcPublicKeyBytes = 65;

struct Sha256Digest {
  std::array<std::uint8_t, 32> bytes{};
};

struct Sha512Digest {
  std::array<std::uint8_t, 64> bytes{};
};

void Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out);

bool HmacSha512(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha512Digest& out);

// Output layout is iv(12) || ciphertext || tag(16). The iv is drawn from
// the platform CSPRNG on every call.
bool AesGcmEncrypt(const std::vector<std::uint8_t>& plain,
                   const std::uint8_t* key, std::size_t key_len,
                   std::vector<std::uint8_t>& out, Error& error);

// Any tag or framing failure reports kAuthenticationFailed with a fixed
// message. Nothing is written to out unless the tag verifies.
bool AesGcmDecrypt(const std::vector<std::uint8_t>& blob,
                   const std::uint8_t* key, std::size_t key_len,
                   std::vector<std::uint8_t>& out, Error& error);

inline bool AesGcmEncrypt(const std::vector<std::uint8_t>& plain,
                          const common::SecureBuffer& key,
                          std::vector<std::uint8_t>& out, Error& error) {
  return AesGcmEncrypt(plain, key.data(), key.size(), out, error);
}

inline bool AesGcmDecrypt(const std::vector<std::uint8_t>& blob,
                          const common::SecureBuffer& key,
                          std::vector<std::uint8_t>& out, Error& error) {
  return AesGcmDecrypt(blob, key.data(), key.size(), out, error);
}

struct EcKeyPair {
  common::SecureBuffer private_der;   // PKCS#8
  std::vector<std::uint8_t> public_key;  // uncompressed point
};

bool GenerateEcKeyPair(EcKeyPair& out, Error& error);

bool PublicKeyFromPrivateDer(const common::SecureBuffer& private_der,
                             std::vector<std::uint8_t>& out_public,
                             Error& error);

// ECDSA P-256 over SHA-256, DER-encoded signature.
bool EcdsaSign(const common::SecureBuffer& private_der,
               const std::vector<std::uint8_t>& message,
               std::vector<std::uint8_t>& out_signature, Error& error);

bool EcdsaVerify(const std::vector<std::uint8_t>& public_key,
                 const std::vector<std::uint8_t>& message,
                 const std::vector<std::uint8_t>& signature, Error& error);

// ECIES: ephemeral P-256 ECDH with the recipient, wrap key is
// SHA-256(shared || id), payload sealed with AES-256-GCM.
// Output is ephemeral_public(65) || iv || ciphertext || tag.
bool PublicEncrypt(const std::vector<std::uint8_t>& plain,
                   const std::vector<std::uint8_t>& recipient_public,
                   const std::vector<std::uint8_t>& id,
                   std::vector<std::uint8_t>& out, Error& error);

bool PrivateDecrypt(const std::vector<std::uint8_t>& blob,
                    const common::SecureBuffer& private_der,
                    const std::vector<std::uint8_t>& id,
                    std::vector<std::uint8_t>& out, Error& error);

}  // namespace ksm::core::crypto

#endif  // KSM_CRYPTO_H
