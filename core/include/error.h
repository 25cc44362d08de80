#ifndef KSM_ERROR_H
#define KSM_ERROR_H

#include <cstdint>
#include <string>
#include <utility>

namespace ksm::core {

enum class ErrorCode : std::uint8_t {
  kNone = 0,
  kUnknownServerKey,
  kAuthenticationFailed,
  kAccessDenied,
  kKeyUnavailable,
  kRevisionConflict,
  kAmbiguousTitle,
  kInvalidNotation,
  kUnexpectedName,
  kMissingField,
  kRecordNotFound,
  kAlreadyBound,
  kStorage,
  kNetwork,
  kCrypto,
  kServer,
  kInvalidArgument,
};

const char* ErrorCodeName(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::kNone};
  std::string message;

  bool ok() const { return code == ErrorCode::kNone; }
  void Clear() {
    code = ErrorCode::kNone;
    message.clear();
  }
  void Set(ErrorCode c, std::string msg) {
    code = c;
    message = std::move(msg);
  }
  std::string ToString() const;
};

// Convenience for the common "fill and return false" shape.
inline bool Fail(Error& error, ErrorCode code, std::string message) {
  error.Set(code, std::move(message));
  return false;
}

}  // namespace ksm::core

#endif  // KSM_ERROR_H
