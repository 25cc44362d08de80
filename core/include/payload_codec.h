#ifndef KSM_PAYLOAD_CODEC_H
#define KSM_PAYLOAD_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.h"
#include "secure_buffer.h"
#include "server_keys.h"
#include "transmission_key.h"

namespace ksm::core {

constexpr char kClientVersion[] = "mc16.7.0";

enum class Endpoint : std::uint8_t {
  kGetSecret = 0,
  kGetFolders,
  kUpdateSecret,
  kCreateSecret,
  kDeleteSecret,
  kFinalizeSecretUpdate,
  kRollbackSecretUpdate,
  kCreateFolder,
  kUpdateFolder,
  kDeleteFolder,
  kAddFile,
};

const char* EndpointName(Endpoint endpoint);
std::string EndpointUrl(const std::string& hostname, Endpoint endpoint);

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string url;
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  const std::string* FindHeader(const std::string& name) const;
};

struct HttpResponse {
  int status{0};
  std::vector<std::uint8_t> body;
};

enum class TransactionType : std::uint8_t { kGeneral = 0, kRotation = 1 };

struct GetPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  // Only sent while binding.
  std::optional<std::string> public_key;
  std::vector<std::string> requested_records;
  std::vector<std::string> requested_folders;
};

struct UpdatePayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string record_uid;
  std::int64_t revision{0};
  std::string data;
  std::optional<TransactionType> transaction_type;
};

struct CompleteTransactionPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string record_uid;
};

struct CreatePayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string record_uid;
  std::string record_key;
  std::string folder_uid;
  std::string folder_key;
  std::string data;
  std::optional<std::string> sub_folder_uid;
};

struct DeletePayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::vector<std::string> record_uids;
};

struct CreateFolderPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string folder_uid;
  std::string shared_folder_uid;
  // Folder key wrapped by the shared folder key.
  std::string shared_folder_key;
  std::string data;
  std::optional<std::string> parent_uid;
};

struct UpdateFolderPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string folder_uid;
  std::string data;
};

struct DeleteFolderPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::vector<std::string> folder_uids;
  bool force_deletion{false};
};

struct FileUploadPayload {
  std::string client_version{kClientVersion};
  std::string client_id;
  std::string file_record_uid;
  std::string file_record_key;
  std::string file_record_data;
  std::string owner_record_uid;
  std::string owner_record_data;
  std::string link_key;
  std::uint64_t file_size{0};
};

std::string ToJson(const GetPayload& payload);
std::string ToJson(const UpdatePayload& payload);
std::string ToJson(const CompleteTransactionPayload& payload);
std::string ToJson(const CreatePayload& payload);
std::string ToJson(const DeletePayload& payload);
std::string ToJson(const CreateFolderPayload& payload);
std::string ToJson(const UpdateFolderPayload& payload);
std::string ToJson(const DeleteFolderPayload& payload);
std::string ToJson(const FileUploadPayload& payload);

// AES-256-GCM under the raw transmission key.
bool EncryptPayload(const std::vector<std::uint8_t>& plain,
                    const TransmissionKey& key,
                    std::vector<std::uint8_t>& out, Error& error);
bool DecryptPayload(const std::vector<std::uint8_t>& blob,
                    const TransmissionKey& key,
                    std::vector<std::uint8_t>& out, Error& error);

// Encrypts payload_json and signs encrypted_key || encrypted_payload with
// the device key.
bool BuildSignedRequest(const std::string& hostname, Endpoint endpoint,
                        const std::string& payload_json,
                        const TransmissionKey& key,
                        const common::SecureBuffer& device_private_der,
                        HttpRequest& out, Error& error);

// Status 200 only. An empty body yields an empty plaintext.
bool DecryptResponse(const HttpResponse& response, const TransmissionKey& key,
                     std::vector<std::uint8_t>& out_plain, Error& error);

struct ServerError {
  enum class Kind : std::uint8_t {
    kKeyRotation = 0,
    kUnknownKey,
    kAccessDenied,
    kClientVersion,
    kRevisionConflict,
    kOther,
  };

  Kind kind{Kind::kOther};
  int status{0};
  std::string code;
  std::string message;
  std::string additional_info;
  std::optional<std::uint32_t> key_id;
};

ServerError ClassifyServerError(const HttpResponse& response,
                                const ServerKeyTable& table);

// Fills error for every kind except kKeyRotation, which the caller retries.
void ServerErrorToError(const ServerError& server_error, Error& error);

}  // namespace ksm::core

#endif  // KSM_PAYLOAD_CODEC_H
