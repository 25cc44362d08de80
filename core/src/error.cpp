#include "error.h"

namespace ksm::core {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "ok";
    case ErrorCode::kUnknownServerKey:
      return "unknown_server_key";
    case ErrorCode::kAuthenticationFailed:
      return "authentication_failed";
    case ErrorCode::kAccessDenied:
      return "access_denied";
    case ErrorCode::kKeyUnavailable:
      return "key_unavailable";
    case ErrorCode::kRevisionConflict:
      return "revision_conflict";
    case ErrorCode::kAmbiguousTitle:
      return "ambiguous_title";
    case ErrorCode::kInvalidNotation:
      return "invalid_notation";
    case ErrorCode::kUnexpectedName:
      return "unexpected_name";
    case ErrorCode::kMissingField:
      return "missing_field";
    case ErrorCode::kRecordNotFound:
      return "record_not_found";
    case ErrorCode::kAlreadyBound:
      return "already_bound";
    case ErrorCode::kStorage:
      return "storage";
    case ErrorCode::kNetwork:
      return "network";
    case ErrorCode::kCrypto:
      return "crypto";
    case ErrorCode::kServer:
      return "server";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

std::string Error::ToString() const {
  std::string out = ErrorCodeName(code);
  if (!message.empty()) {
    out.append(": ");
    out.append(message);
  }
  return out;
}

}  // namespace ksm::core
