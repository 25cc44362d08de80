#include "payload_codec.h"

#include <nlohmann/json.hpp>

#include <cctype>

#include "crypto.h"
#include "encoding_utils.h"

namespace ksm::core {

namespace {

using nlohmann::json;

constexpr char kApiPrefix[] = "/api/rest/sm/v1/";

std::string DumpString(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return {};
  }
  return value.dump();
}

bool ReadKeyId(const json& value, std::uint32_t& out) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > 0xFFFFFFFFull) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v < 0 || v > 0xFFFFFFFFll) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
  }
  if (value.is_string()) {
    const std::string text = value.get<std::string>();
    if (text.empty() || text.size() > 10) return false;
    std::uint64_t v = 0;
    for (const char ch : text) {
      if (ch < '0' || ch > '9') return false;
      v = v * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    if (v > 0xFFFFFFFFull) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
  }
  return false;
}

}  // namespace

const char* EndpointName(Endpoint endpoint) {
  switch (endpoint) {
    case Endpoint::kGetSecret:
      return "get_secret";
    case Endpoint::kGetFolders:
      return "get_folders";
    case Endpoint::kUpdateSecret:
      return "update_secret";
    case Endpoint::kCreateSecret:
      return "create_secret";
    case Endpoint::kDeleteSecret:
      return "delete_secret";
    case Endpoint::kFinalizeSecretUpdate:
      return "finalize_secret_update";
    case Endpoint::kRollbackSecretUpdate:
      return "rollback_secret_update";
    case Endpoint::kCreateFolder:
      return "create_folder";
    case Endpoint::kUpdateFolder:
      return "update_folder";
    case Endpoint::kDeleteFolder:
      return "delete_folder";
    case Endpoint::kAddFile:
      return "add_file";
  }
  return "unknown";
}

std::string EndpointUrl(const std::string& hostname, Endpoint endpoint) {
  return "https://" + hostname + kApiPrefix + EndpointName(endpoint);
}

const std::string* HttpRequest::FindHeader(const std::string& name) const {
  for (const auto& header : headers) {
    if (header.first.size() != name.size()) continue;
    bool same = true;
    for (std::size_t i = 0; i < name.size() && same; ++i) {
      const auto a = static_cast<unsigned char>(header.first[i]);
      const auto b = static_cast<unsigned char>(name[i]);
      same = std::tolower(a) == std::tolower(b);
    }
    if (same) return &header.second;
  }
  return nullptr;
}

std::string ToJson(const GetPayload& payload) {
  json doc = {{"clientVersion", payload.client_version},
              {"clientId", payload.client_id}};
  if (payload.public_key.has_value()) {
    doc["publicKey"] = *payload.public_key;
  }
  if (!payload.requested_records.empty()) {
    doc["requestedRecords"] = payload.requested_records;
  }
  if (!payload.requested_folders.empty()) {
    doc["requestedFolders"] = payload.requested_folders;
  }
  return doc.dump();
}

std::string ToJson(const UpdatePayload& payload) {
  json doc = {{"clientVersion", payload.client_version},
              {"clientId", payload.client_id},
              {"recordUid", payload.record_uid},
              {"revision", payload.revision},
              {"data", payload.data}};
  if (payload.transaction_type.has_value()) {
    doc["transactionType"] =
        *payload.transaction_type == TransactionType::kRotation ? "rotation"
                                                                : "general";
  }
  return doc.dump();
}

std::string ToJson(const CompleteTransactionPayload& payload) {
  const json doc = {{"clientVersion", payload.client_version},
                    {"clientId", payload.client_id},
                    {"recordUid", payload.record_uid}};
  return doc.dump();
}

std::string ToJson(const CreatePayload& payload) {
  json doc = {{"clientVersion", payload.client_version},
              {"clientId", payload.client_id},
              {"recordUid", payload.record_uid},
              {"recordKey", payload.record_key},
              {"folderUid", payload.folder_uid},
              {"folderKey", payload.folder_key},
              {"data", payload.data}};
  if (payload.sub_folder_uid.has_value()) {
    doc["subFolderUid"] = *payload.sub_folder_uid;
  }
  return doc.dump();
}

std::string ToJson(const DeletePayload& payload) {
  const json doc = {{"clientVersion", payload.client_version},
                    {"clientId", payload.client_id},
                    {"recordUids", payload.record_uids}};
  return doc.dump();
}

std::string ToJson(const CreateFolderPayload& payload) {
  json doc = {{"clientVersion", payload.client_version},
              {"clientId", payload.client_id},
              {"folderUid", payload.folder_uid},
              {"sharedFolderUid", payload.shared_folder_uid},
              {"sharedFolderKey", payload.shared_folder_key},
              {"data", payload.data}};
  if (payload.parent_uid.has_value()) {
    doc["parentUid"] = *payload.parent_uid;
  }
  return doc.dump();
}

std::string ToJson(const UpdateFolderPayload& payload) {
  const json doc = {{"clientVersion", payload.client_version},
                    {"clientId", payload.client_id},
                    {"folderUid", payload.folder_uid},
                    {"data", payload.data}};
  return doc.dump();
}

std::string ToJson(const DeleteFolderPayload& payload) {
  const json doc = {{"clientVersion", payload.client_version},
                    {"clientId", payload.client_id},
                    {"folderUids", payload.folder_uids},
                    {"forceDeletion", payload.force_deletion}};
  return doc.dump();
}

std::string ToJson(const FileUploadPayload& payload) {
  const json doc = {{"clientVersion", payload.client_version},
                    {"clientId", payload.client_id},
                    {"fileRecordUid", payload.file_record_uid},
                    {"fileRecordKey", payload.file_record_key},
                    {"fileRecordData", payload.file_record_data},
                    {"ownerRecordUid", payload.owner_record_uid},
                    {"ownerRecordData", payload.owner_record_data},
                    {"linkKey", payload.link_key},
                    {"fileSize", payload.file_size}};
  return doc.dump();
}

bool EncryptPayload(const std::vector<std::uint8_t>& plain,
                    const TransmissionKey& key,
                    std::vector<std::uint8_t>& out, Error& error) {
  return crypto::AesGcmEncrypt(plain, key.key, out, error);
}

bool DecryptPayload(const std::vector<std::uint8_t>& blob,
                    const TransmissionKey& key,
                    std::vector<std::uint8_t>& out, Error& error) {
  return crypto::AesGcmDecrypt(blob, key.key, out, error);
}

bool BuildSignedRequest(const std::string& hostname, Endpoint endpoint,
                        const std::string& payload_json,
                        const TransmissionKey& key,
                        const common::SecureBuffer& device_private_der,
                        HttpRequest& out, Error& error) {
  if (hostname.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "hostname empty");
  }
  std::vector<std::uint8_t> plain = common::StringToBytes(payload_json);
  common::ScopedWipe wipe_plain(plain);
  std::vector<std::uint8_t> encrypted;
  if (!EncryptPayload(plain, key, encrypted, error)) {
    return false;
  }

  std::vector<std::uint8_t> signed_bytes;
  signed_bytes.reserve(key.encrypted_key.size() + encrypted.size());
  signed_bytes.insert(signed_bytes.end(), key.encrypted_key.begin(),
                      key.encrypted_key.end());
  signed_bytes.insert(signed_bytes.end(), encrypted.begin(), encrypted.end());
  std::vector<std::uint8_t> signature;
  if (!crypto::EcdsaSign(device_private_der, signed_bytes, signature, error)) {
    return false;
  }

  out.url = EndpointUrl(hostname, endpoint);
  out.headers = {
      {"PublicKeyId", std::to_string(key.public_key_id)},
      {"TransmissionKey", common::Base64Encode(key.encrypted_key)},
      {"Authorization", "Signature " + common::Base64Encode(signature)},
      {"Content-Type", "application/octet-stream"},
  };
  out.body = std::move(encrypted);
  return true;
}

bool DecryptResponse(const HttpResponse& response, const TransmissionKey& key,
                     std::vector<std::uint8_t>& out_plain, Error& error) {
  out_plain.clear();
  if (response.status != 200) {
    return Fail(error, ErrorCode::kServer,
                "unexpected status " + std::to_string(response.status));
  }
  if (response.body.empty()) {
    return true;
  }
  return DecryptPayload(response.body, key, out_plain, error);
}

ServerError ClassifyServerError(const HttpResponse& response,
                                const ServerKeyTable& table) {
  ServerError out;
  out.status = response.status;
  const std::string text = common::BytesToString(response.body);
  const json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    out.message = text.empty() ? "http status " + std::to_string(response.status)
                               : text;
    out.kind = response.status == 409 ? ServerError::Kind::kRevisionConflict
                                      : ServerError::Kind::kOther;
    return out;
  }

  if (doc.contains("result_code")) {
    out.code = DumpString(doc["result_code"]);
  } else if (doc.contains("error")) {
    out.code = DumpString(doc["error"]);
  }
  if (doc.contains("message")) {
    out.message = DumpString(doc["message"]);
  }
  if (doc.contains("additional_info")) {
    out.additional_info = DumpString(doc["additional_info"]);
  }

  if (out.code == "key") {
    std::uint32_t id = 0;
    if (doc.contains("key_id") && ReadKeyId(doc["key_id"], id)) {
      out.key_id = id;
      out.kind = table.Contains(id) ? ServerError::Kind::kKeyRotation
                                    : ServerError::Kind::kUnknownKey;
    } else {
      out.kind = ServerError::Kind::kUnknownKey;
    }
  } else if (out.code == "access_denied" ||
             out.message.find("signature is invalid") != std::string::npos) {
    out.kind = ServerError::Kind::kAccessDenied;
  } else if (out.code == "invalid_client_version") {
    out.kind = ServerError::Kind::kClientVersion;
  } else if (out.code == "out_of_date" || out.code == "revision_conflict" ||
             response.status == 409) {
    out.kind = ServerError::Kind::kRevisionConflict;
  }
  return out;
}

void ServerErrorToError(const ServerError& server_error, Error& error) {
  const std::string detail =
      "Error: " + server_error.code + ", message=" + server_error.message;
  switch (server_error.kind) {
    case ServerError::Kind::kKeyRotation:
      error.Set(ErrorCode::kServer,
                "server requested key " +
                    std::to_string(server_error.key_id.value_or(0)));
      return;
    case ServerError::Kind::kUnknownKey:
      error.Set(ErrorCode::kUnknownServerKey,
                server_error.key_id.has_value()
                    ? "server requested unknown key " +
                          std::to_string(*server_error.key_id)
                    : "server requested a key without key_id");
      return;
    case ServerError::Kind::kAccessDenied:
      error.Set(ErrorCode::kAccessDenied, detail);
      return;
    case ServerError::Kind::kClientVersion:
      error.Set(ErrorCode::kAccessDenied,
                detail + ", additional_info=" + server_error.additional_info);
      return;
    case ServerError::Kind::kRevisionConflict:
      error.Set(ErrorCode::kRevisionConflict, detail);
      return;
    case ServerError::Kind::kOther:
      break;
  }
  if (server_error.code.empty()) {
    error.Set(ErrorCode::kServer, "http " +
                                      std::to_string(server_error.status) +
                                      ": " + server_error.message);
    return;
  }
  error.Set(ErrorCode::kServer, detail);
}

}  // namespace ksm::core
