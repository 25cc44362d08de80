#include "crypto.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cstring>
#include <memory>

#include "platform_random.h"

namespace ksm::core::crypto {

namespace {

// DER SubjectPublicKeyInfo header for an uncompressed P-256 point.
constexpr std::uint8_t kP256SpkiPrefix[] = {
    0x30, 0x59, 0x30, 0x13, 0x06, 0x07, 0x2a, 0x86, 0x48,
    0xce, 0x3d, 0x02, 0x01, 0x06, 0x08, 0x2a, 0x86, 0x48,
    0xce, 0x3d, 0x03, 0x01, 0x07, 0x03, 0x42, 0x00};

constexpr char kAuthFailed[] = "decryption failed";

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct P8Deleter {
  void operator()(PKCS8_PRIV_KEY_INFO* p) const { PKCS8_PRIV_KEY_INFO_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using P8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, P8Deleter>;

PkeyPtr LoadPublicKey(const std::vector<std::uint8_t>& raw) {
  if (raw.size() != kEcPublicKeyBytes || raw[0] != 0x04) {
    return PkeyPtr();
  }
  std::vector<std::uint8_t> spki(std::begin(kP256SpkiPrefix),
                                 std::end(kP256SpkiPrefix));
  spki.insert(spki.end(), raw.begin(), raw.end());
  const unsigned char* p = spki.data();
  PkeyPtr key(d2i_PUBKEY(nullptr, &p, static_cast<long>(spki.size())));
  ERR_clear_error();
  return key;
}

bool EncodePublicKey(EVP_PKEY* key, std::vector<std::uint8_t>& out) {
  out.clear();
  const int len = i2d_PUBKEY(key, nullptr);
  if (len != static_cast<int>(sizeof(kP256SpkiPrefix) + kEcPublicKeyBytes)) {
    return false;
  }
  std::vector<std::uint8_t> spki(static_cast<std::size_t>(len));
  unsigned char* p = spki.data();
  if (i2d_PUBKEY(key, &p) != len ||
      !std::equal(std::begin(kP256SpkiPrefix), std::end(kP256SpkiPrefix),
                  spki.begin())) {
    return false;
  }
  out.assign(spki.begin() + sizeof(kP256SpkiPrefix), spki.end());
  return true;
}

PkeyPtr LoadPrivateKey(const common::SecureBuffer& der) {
  if (der.empty()) {
    return PkeyPtr();
  }
  const unsigned char* p = der.data();
  P8Ptr p8(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(der.size())));
  if (!p8) {
    ERR_clear_error();
    return PkeyPtr();
  }
  PkeyPtr key(EVP_PKCS82PKEY(p8.get()));
  if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_EC) {
    ERR_clear_error();
    return PkeyPtr();
  }
  return key;
}

bool EncodePrivateKey(EVP_PKEY* key, common::SecureBuffer& out) {
  P8Ptr p8(EVP_PKEY2PKCS8(key));
  if (!p8) {
    return false;
  }
  const int len = i2d_PKCS8_PRIV_KEY_INFO(p8.get(), nullptr);
  if (len <= 0) {
    return false;
  }
  common::SecureBuffer der(static_cast<std::size_t>(len));
  unsigned char* p = der.data();
  if (i2d_PKCS8_PRIV_KEY_INFO(p8.get(), &p) != len) {
    return false;
  }
  out = std::move(der);
  return true;
}

PkeyPtr GenerateP256() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(),
                                             NID_X9_62_prime256v1) != 1 ||
      EVP_PKEY_CTX_set_ec_param_enc(ctx.get(), OPENSSL_EC_NAMED_CURVE) != 1) {
    return PkeyPtr();
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    return PkeyPtr();
  }
  return PkeyPtr(raw);
}

bool DeriveWrapKey(EVP_PKEY* own, EVP_PKEY* peer,
                   const std::vector<std::uint8_t>& id,
                   common::SecureBuffer& out_key) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own, nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
      EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
    return false;
  }
  std::size_t len = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1 || len == 0) {
    return false;
  }
  std::vector<std::uint8_t> shared;
  shared.reserve(len + id.size());
  shared.resize(len);
  common::ScopedWipe wipe_shared(shared);
  if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1) {
    return false;
  }
  shared.resize(len);
  shared.insert(shared.end(), id.begin(), id.end());
  Sha256Digest digest;
  Sha256(shared.data(), shared.size(), digest);
  out_key.assign(digest.bytes.data(), digest.bytes.size());
  common::SecureWipe(digest.bytes);
  return true;
}

}  // namespace

void Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out) {
  unsigned int out_len = 0;
  static const std::uint8_t kEmpty = 0;
  EVP_Digest(data ? data : &kEmpty, len, out.bytes.data(), &out_len,
             EVP_sha256(), nullptr);
}

bool HmacSha512(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha512Digest& out) {
  unsigned int out_len = 0;
  static const std::uint8_t kEmpty = 0;
  const unsigned char* res =
      HMAC(EVP_sha512(), key ? key : &kEmpty, static_cast<int>(key_len),
           data ? data : &kEmpty, data_len, out.bytes.data(), &out_len);
  return res != nullptr && out_len == out.bytes.size();
}

bool AesGcmEncrypt(const std::vector<std::uint8_t>& plain,
                   const std::uint8_t* key, std::size_t key_len,
                   std::vector<std::uint8_t>& out, Error& error) {
  out.clear();
  if (!key || key_len != kAesKeyBytes) {
    return Fail(error, ErrorCode::kCrypto, "aes key size invalid");
  }
  std::array<std::uint8_t, kGcmIvBytes> iv{};
  if (!platform::RandomBytes(iv.data(), iv.size())) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kGcmIvBytes), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, iv.data()) != 1) {
    return Fail(error, ErrorCode::kCrypto, "aes-gcm init failed");
  }
  std::vector<std::uint8_t> buf(kGcmIvBytes + plain.size() + kGcmTagBytes);
  std::memcpy(buf.data(), iv.data(), iv.size());
  int len = 0;
  if (!plain.empty() &&
      EVP_EncryptUpdate(ctx.get(), buf.data() + kGcmIvBytes, &len,
                        plain.data(), static_cast<int>(plain.size())) != 1) {
    return Fail(error, ErrorCode::kCrypto, "aes-gcm encrypt failed");
  }
  int fin = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), buf.data() + kGcmIvBytes + len, &fin) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kGcmTagBytes),
                          buf.data() + kGcmIvBytes + plain.size()) != 1) {
    return Fail(error, ErrorCode::kCrypto, "aes-gcm encrypt failed");
  }
  out = std::move(buf);
  return true;
}

bool AesGcmDecrypt(const std::vector<std::uint8_t>& blob,
                   const std::uint8_t* key, std::size_t key_len,
                   std::vector<std::uint8_t>& out, Error& error) {
  out.clear();
  if (!key || key_len != kAesKeyBytes) {
    return Fail(error, ErrorCode::kCrypto, "aes key size invalid");
  }
  if (blob.size() < kGcmIvBytes + kGcmTagBytes) {
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  const std::size_t ct_len = blob.size() - kGcmIvBytes - kGcmTagBytes;
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kGcmIvBytes), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, blob.data()) != 1) {
    return Fail(error, ErrorCode::kCrypto, "aes-gcm init failed");
  }
  std::vector<std::uint8_t> plain(ct_len);
  common::ScopedWipe wipe_plain(plain);
  int len = 0;
  if (ct_len > 0 &&
      EVP_DecryptUpdate(ctx.get(), plain.data(), &len,
                        blob.data() + kGcmIvBytes,
                        static_cast<int>(ct_len)) != 1) {
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  std::array<std::uint8_t, kGcmTagBytes> tag{};
  std::memcpy(tag.data(), blob.data() + kGcmIvBytes + ct_len, tag.size());
  int fin = 0;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), plain.data() + len, &fin) != 1) {
    ERR_clear_error();
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  wipe_plain.Release();
  out = std::move(plain);
  return true;
}

bool GenerateEcKeyPair(EcKeyPair& out, Error& error) {
  PkeyPtr key = GenerateP256();
  if (!key) {
    return Fail(error, ErrorCode::kCrypto, "ec key generation failed");
  }
  if (!EncodePrivateKey(key.get(), out.private_der) ||
      !EncodePublicKey(key.get(), out.public_key)) {
    return Fail(error, ErrorCode::kCrypto, "ec key encode failed");
  }
  return true;
}

bool PublicKeyFromPrivateDer(const common::SecureBuffer& private_der,
                             std::vector<std::uint8_t>& out_public,
                             Error& error) {
  PkeyPtr key = LoadPrivateKey(private_der);
  if (!key) {
    return Fail(error, ErrorCode::kCrypto, "private key invalid");
  }
  if (!EncodePublicKey(key.get(), out_public)) {
    return Fail(error, ErrorCode::kCrypto, "public key encode failed");
  }
  return true;
}

bool EcdsaSign(const common::SecureBuffer& private_der,
               const std::vector<std::uint8_t>& message,
               std::vector<std::uint8_t>& out_signature, Error& error) {
  out_signature.clear();
  PkeyPtr key = LoadPrivateKey(private_der);
  if (!key) {
    return Fail(error, ErrorCode::kCrypto, "private key invalid");
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  std::size_t sig_len = 0;
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key.get()) != 1 ||
      EVP_DigestSign(ctx.get(), nullptr, &sig_len, message.data(),
                     message.size()) != 1) {
    return Fail(error, ErrorCode::kCrypto, "sign init failed");
  }
  out_signature.resize(sig_len);
  if (EVP_DigestSign(ctx.get(), out_signature.data(), &sig_len,
                     message.data(), message.size()) != 1) {
    out_signature.clear();
    return Fail(error, ErrorCode::kCrypto, "sign failed");
  }
  out_signature.resize(sig_len);
  return true;
}

bool EcdsaVerify(const std::vector<std::uint8_t>& public_key,
                 const std::vector<std::uint8_t>& message,
                 const std::vector<std::uint8_t>& signature, Error& error) {
  PkeyPtr key = LoadPublicKey(public_key);
  if (!key) {
    return Fail(error, ErrorCode::kInvalidArgument, "public key invalid");
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                   key.get()) != 1) {
    return Fail(error, ErrorCode::kCrypto, "verify init failed");
  }
  if (EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                       message.data(), message.size()) != 1) {
    ERR_clear_error();
    return Fail(error, ErrorCode::kAuthenticationFailed,
                "signature verification failed");
  }
  return true;
}

bool PublicEncrypt(const std::vector<std::uint8_t>& plain,
                   const std::vector<std::uint8_t>& recipient_public,
                   const std::vector<std::uint8_t>& id,
                   std::vector<std::uint8_t>& out, Error& error) {
  out.clear();
  PkeyPtr peer = LoadPublicKey(recipient_public);
  if (!peer) {
    return Fail(error, ErrorCode::kInvalidArgument, "recipient key invalid");
  }
  PkeyPtr ephemeral = GenerateP256();
  std::vector<std::uint8_t> ephemeral_public;
  if (!ephemeral || !EncodePublicKey(ephemeral.get(), ephemeral_public)) {
    return Fail(error, ErrorCode::kCrypto, "ephemeral key failed");
  }
  common::SecureBuffer wrap_key;
  if (!DeriveWrapKey(ephemeral.get(), peer.get(), id, wrap_key)) {
    return Fail(error, ErrorCode::kCrypto, "key agreement failed");
  }
  std::vector<std::uint8_t> sealed;
  if (!AesGcmEncrypt(plain, wrap_key, sealed, error)) {
    return false;
  }
  out = std::move(ephemeral_public);
  out.insert(out.end(), sealed.begin(), sealed.end());
  return true;
}

bool PrivateDecrypt(const std::vector<std::uint8_t>& blob,
                    const common::SecureBuffer& private_der,
                    const std::vector<std::uint8_t>& id,
                    std::vector<std::uint8_t>& out, Error& error) {
  out.clear();
  PkeyPtr own = LoadPrivateKey(private_der);
  if (!own) {
    return Fail(error, ErrorCode::kCrypto, "private key invalid");
  }
  if (blob.size() < kEcPublicKeyBytes + kGcmIvBytes + kGcmTagBytes) {
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  const std::vector<std::uint8_t> ephemeral_public(
      blob.begin(), blob.begin() + kEcPublicKeyBytes);
  PkeyPtr peer = LoadPublicKey(ephemeral_public);
  if (!peer) {
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  common::SecureBuffer wrap_key;
  if (!DeriveWrapKey(own.get(), peer.get(), id, wrap_key)) {
    return Fail(error, ErrorCode::kAuthenticationFailed, kAuthFailed);
  }
  const std::vector<std::uint8_t> sealed(blob.begin() + kEcPublicKeyBytes,
                                         blob.end());
  return AesGcmDecrypt(sealed, wrap_key, out, error);
}

}  // namespace ksm::core::crypto
