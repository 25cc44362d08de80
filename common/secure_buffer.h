#ifndef KSM_SECURE_BUFFER_H
#define KSM_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "monocypher.h"

namespace ksm::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  crypto_wipe(data, len);
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

inline void SecureWipe(std::string& text) {
  SecureWipe(text.data(), text.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Wipes a buffer it does not own when going out of scope.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf) : vec_(&buf) {}
  explicit ScopedWipe(std::string& text) : str_(&text) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() {
    if (vec_) {
      SecureWipe(*vec_);
    }
    if (str_) {
      SecureWipe(*str_);
    }
  }

  void Release() {
    vec_ = nullptr;
    str_ = nullptr;
  }

 private:
  std::vector<std::uint8_t>* vec_{nullptr};
  std::string* str_{nullptr};
};

// Move-only owner of key material. Contents are wiped on destruction,
// on move-assignment and on Clear().
class SecureBuffer {
 public:
  SecureBuffer() = default;
  explicit SecureBuffer(std::size_t size) : data_(size) {}

  SecureBuffer(const std::uint8_t* data, std::size_t len)
      : data_(data, data + len) {}

  explicit SecureBuffer(std::vector<std::uint8_t>&& bytes)
      : data_(std::move(bytes)) {}

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;

  SecureBuffer(SecureBuffer&& other) noexcept
      : data_(std::move(other.data_)) {
    other.data_.clear();
  }

  SecureBuffer& operator=(SecureBuffer&& other) noexcept {
    if (this == &other) {
      return *this;
    }
    SecureWipe(data_);
    data_ = std::move(other.data_);
    other.data_.clear();
    return *this;
  }

  ~SecureBuffer() { SecureWipe(data_); }

  std::uint8_t* data() { return data_.data(); }
  const std::uint8_t* data() const { return data_.data(); }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  void assign(const std::uint8_t* data, std::size_t len) {
    SecureWipe(data_);
    data_.assign(data, data + len);
  }

  void Clear() {
    SecureWipe(data_);
    data_.clear();
  }

  SecureBuffer Clone() const { return SecureBuffer(data_.data(), data_.size()); }

  const std::vector<std::uint8_t>& bytes() const { return data_; }

 private:
  std::vector<std::uint8_t> data_;
};

}  // namespace ksm::common

#endif  // KSM_SECURE_BUFFER_H
