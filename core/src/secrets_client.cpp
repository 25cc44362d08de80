#include "secrets_client.h"

#include <utility>

#include "crypto.h"
#include "encoding_utils.h"
#include "platform_log.h"

namespace ksm::core {

namespace {

using nlohmann::json;

constexpr char kTag[] = "secrets_client";

bool ParseResponse(const std::vector<std::uint8_t>& plain, json& out,
                   Error& error) {
  if (plain.empty()) {
    out = json::object();
    return true;
  }
  out = json::parse(plain.begin(), plain.end(), nullptr, false);
  if (out.is_discarded() || !out.is_object()) {
    return Fail(error, ErrorCode::kServer, "response is not a json object");
  }
  return true;
}

bool DecodeOptionalBase64(const json& doc, const char* key,
                          std::vector<std::uint8_t>& out, Error& error) {
  out.clear();
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    return true;
  }
  if (!common::Base64Decode(it->get<std::string>(), out)) {
    return Fail(error, ErrorCode::kServer, std::string(key) +
                                               " is not base64");
  }
  return true;
}

void LogFailure(const char* operation, const Error& error) {
  platform::log::Log(platform::log::Level::kError, kTag, "operation failed",
                     {{"op", operation},
                      {"code", ErrorCodeName(error.code)},
                      {"detail", error.message}});
}

}  // namespace

SecretsClientOptions MakeClientOptions(const ClientConfig& config,
                                       std::shared_ptr<ConfigStore> store) {
  SecretsClientOptions options;
  options.store = std::move(store);
  if (!config.hostname.empty()) {
    options.hostname = config.hostname;
  }
  if (config.server_public_key_id != 0) {
    options.server_public_key_id = config.server_public_key_id;
  }
  options.verify_ssl = config.verify_ssl;
  options.ca_bundle = config.ca_bundle;
  options.timeout_ms = config.timeout_ms;
  if (config.cache_enabled) {
    options.cache_path = config.cache_path;
  }
  return options;
}

SecretsClient::SecretsClient(SecretsClientOptions options)
    : options_(std::move(options)) {}

bool SecretsClient::Init(Error& error) {
  if (!options_.store) {
    return Fail(error, ErrorCode::kInvalidArgument, "config store missing");
  }
  key_table_ = options_.key_table ? options_.key_table
                                  : &ServerKeyTable::Production();
  if (!options_.transport) {
    HttpsOptions https;
    https.verify_ssl = options_.verify_ssl;
    https.ca_bundle = options_.ca_bundle;
    https.timeout_ms = options_.timeout_ms;
    options_.transport = std::make_shared<HttpsTransport>(std::move(https));
    if (!options_.verify_ssl) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "tls certificate verification disabled");
    }
  }
  if (options_.cache_path) {
    options_.transport = std::make_shared<CachingTransport>(
        options_.transport, *options_.cache_path);
  }
  if (options_.token) {
    InitializeOptions init;
    init.hostname = options_.hostname;
    init.server_public_key_id = options_.server_public_key_id;
    init.force = options_.force_rebind;
    if (!InitializeStorage(*options_.store, *options_.token, *key_table_, init,
                           error)) {
      LogFailure("init", error);
      return false;
    }
  }
  return true;
}

bool SecretsClient::LoadCredentials(DeviceCredentials& out,
                                    Error& error) const {
  if (!key_table_) {
    return Fail(error, ErrorCode::kInvalidArgument, "client not initialized");
  }
  if (!LoadDeviceCredentials(*options_.store, out, error)) {
    return false;
  }
  if (options_.hostname) {
    out.hostname = *options_.hostname;
  }
  if (!out.server_public_key_id && options_.server_public_key_id) {
    out.server_public_key_id = options_.server_public_key_id;
  }
  return true;
}

bool SecretsClient::PostQuery(Endpoint endpoint,
                              const std::string& payload_json,
                              DeviceCredentials& creds,
                              std::vector<std::uint8_t>& out_plain,
                              Error& error) {
  for (int attempt = 0; attempt < 2; ++attempt) {
    TransmissionKey key;
    if (!NewTransmissionKey(*key_table_, creds.server_public_key_id, key,
                            error)) {
      return false;
    }
    HttpRequest request;
    if (!BuildSignedRequest(creds.hostname, endpoint, payload_json, key,
                            creds.private_key, request, error)) {
      return false;
    }
    HttpResponse response;
    if (!options_.transport->Post(request, key, response, error)) {
      return false;
    }
    if (response.status == 200) {
      return DecryptResponse(response, key, out_plain, error);
    }

    const ServerError server_error =
        ClassifyServerError(response, *key_table_);
    if (server_error.kind == ServerError::Kind::kKeyRotation &&
        attempt == 0) {
      const std::uint32_t id = *server_error.key_id;
      platform::log::Log(platform::log::Level::kInfo, kTag,
                         "server requested another public key",
                         {{"key_id", std::to_string(id)}});
      if (options_.store->read_only()) {
        platform::log::Log(platform::log::Level::kWarn, kTag,
                           "config is read-only; new key id kept in memory",
                           {{"key_id", std::to_string(id)}});
      } else if (!options_.store->Set(config_keys::kServerPublicKeyId,
                                      std::to_string(id), error)) {
        return false;
      }
      creds.server_public_key_id = id;
      continue;
    }
    ServerErrorToError(server_error, error);
    platform::log::Log(platform::log::Level::kError, kTag, "request rejected",
                       {{"endpoint", EndpointName(endpoint)},
                        {"status", std::to_string(response.status)},
                        {"code", server_error.code}});
    return false;
  }
  return Fail(error, ErrorCode::kServer, "key rotation did not settle");
}

bool SecretsClient::FetchSecrets(const std::vector<std::string>& uids,
                                 RecordGraph& out, bool& just_bound,
                                 Error& error) {
  just_bound = false;
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  GetPayload payload;
  payload.client_version = options_.client_version;
  payload.client_id = creds.client_id;
  payload.requested_records = uids;
  if (creds.state == BindingState::kBinding) {
    std::vector<std::uint8_t> public_key;
    if (!crypto::PublicKeyFromPrivateDer(creds.private_key, public_key,
                                         error)) {
      return false;
    }
    payload.public_key = common::Base64Encode(public_key);
  }

  std::vector<std::uint8_t> plain;
  common::ScopedWipe wipe_plain(plain);
  if (!PostQuery(Endpoint::kGetSecret, ToJson(payload), creds, plain, error)) {
    return false;
  }
  json response;
  if (!ParseResponse(plain, response, error)) {
    return false;
  }

  std::vector<std::uint8_t> encrypted_app_key;
  if (!DecodeOptionalBase64(response, "encryptedAppKey", encrypted_app_key,
                            error)) {
    return false;
  }
  if (!encrypted_app_key.empty()) {
    if (creds.state == BindingState::kBinding) {
      std::vector<std::uint8_t> owner_key;
      if (!DecodeOptionalBase64(response, "appOwnerPublicKey", owner_key,
                                error)) {
        return false;
      }
      if (!CompleteBinding(*options_.store, creds.client_id,
                           encrypted_app_key, owner_key, error)) {
        return false;
      }
      if (!LoadCredentials(creds, error)) {
        return false;
      }
      just_bound = true;
    } else {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "ignoring app key sent to a bound client");
    }
  } else if (creds.state == BindingState::kBinding) {
    return Fail(error, ErrorCode::kServer,
                "binding response carries no application key");
  }
  return DecodeSecretsResponse(creds.app_key, response, out, error);
}

bool SecretsClient::GetSecrets(const std::vector<std::string>& uids,
                               RecordGraph& out, Error& error) {
  bool just_bound = false;
  if (!FetchSecrets(uids, out, just_bound, error)) {
    LogFailure("get_secret", error);
    return false;
  }
  if (just_bound) {
    // The server finishes the device registration on the next signed call.
    RecordGraph confirmed;
    Error confirm_error;
    bool again = false;
    if (FetchSecrets(uids, confirmed, again, confirm_error)) {
      out = std::move(confirmed);
    } else {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "post-binding fetch failed",
                         {{"code", ErrorCodeName(confirm_error.code)}});
    }
  }
  return true;
}

bool SecretsClient::GetSecretsByTitle(const std::string& title,
                                      std::vector<std::string>& out_uids,
                                      RecordGraph& out, Error& error) {
  out_uids.clear();
  if (!GetSecrets({}, out, error)) {
    return false;
  }
  for (const KeeperRecord* record : out.FindRecordsByTitle(title)) {
    out_uids.push_back(record->uid);
  }
  return true;
}

bool SecretsClient::GetFolders(std::vector<KeeperFolder>& out, Error& error) {
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  if (creds.state != BindingState::kBound) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "application key unavailable until binding completes");
  }
  GetPayload payload;
  payload.client_version = options_.client_version;
  payload.client_id = creds.client_id;
  std::vector<std::uint8_t> plain;
  common::ScopedWipe wipe_plain(plain);
  json response;
  if (!PostQuery(Endpoint::kGetFolders, ToJson(payload), creds, plain,
                 error) ||
      !ParseResponse(plain, response, error) ||
      !DecodeFoldersResponse(creds.app_key, response, out, error)) {
    LogFailure("get_folders", error);
    return false;
  }
  return true;
}

bool SecretsClient::UpdateSecret(
    RecordGraph& graph, const std::string& uid,
    std::optional<TransactionType> transaction_type, Error& error) {
  KeeperRecord* record = graph.FindRecord(uid);
  if (!record) {
    return Fail(error, ErrorCode::kRecordNotFound,
                "record " + uid + " not in graph");
  }
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  UpdatePayload payload;
  if (!PrepareUpdate(graph, *record, creds.client_id, transaction_type,
                     payload, error)) {
    LogFailure("update_secret", error);
    return false;
  }
  payload.client_version = options_.client_version;

  std::vector<std::uint8_t> plain;
  common::ScopedWipe wipe_plain(plain);
  if (!PostQuery(Endpoint::kUpdateSecret, ToJson(payload), creds, plain,
                 error)) {
    LogFailure("update_secret", error);
    return false;
  }
  record->revision_pending = true;

  json response;
  Error parse_error;
  if (ParseResponse(plain, response, parse_error)) {
    const auto it = response.find("revision");
    if (it != response.end() && it->is_number_integer()) {
      record->revision = it->get<std::int64_t>();
      record->revision_pending = false;
      return true;
    }
  }

  if (!RefreshRecord(*record, false)) {
    platform::log::Log(platform::log::Level::kWarn, kTag,
                       "update saved but new revision unknown",
                       {{"uid", uid}});
  }
  return true;
}

// Clears revision_pending from a fresh fetch. With replace_data the whole
// record, files included, is taken from the server.
bool SecretsClient::RefreshRecord(KeeperRecord& record, bool replace_data) {
  RecordGraph fresh;
  Error fetch_error;
  bool just_bound = false;
  if (!FetchSecrets({record.uid}, fresh, just_bound, fetch_error)) {
    return false;
  }
  KeeperRecord* updated = fresh.FindRecord(record.uid);
  if (!updated) {
    return false;
  }
  if (replace_data) {
    record = std::move(*updated);
  } else {
    record.revision = updated->revision;
  }
  record.revision_pending = false;
  return true;
}

bool SecretsClient::CompleteTransaction(const std::string& uid, bool rollback,
                                        Error& error) {
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  CompleteTransactionPayload payload;
  payload.client_version = options_.client_version;
  payload.client_id = creds.client_id;
  payload.record_uid = uid;
  std::vector<std::uint8_t> plain;
  const Endpoint endpoint = rollback ? Endpoint::kRollbackSecretUpdate
                                     : Endpoint::kFinalizeSecretUpdate;
  if (!PostQuery(endpoint, ToJson(payload), creds, plain, error)) {
    LogFailure(EndpointName(endpoint), error);
    return false;
  }
  return true;
}

bool SecretsClient::CreateSecret(const std::string& folder_uid,
                                 const json& record_data,
                                 std::string& out_uid, Error& error) {
  out_uid.clear();
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  std::vector<KeeperFolder> folders;
  if (!GetFolders(folders, error)) {
    return false;
  }
  CreatePayload payload;
  if (!PrepareCreate(folders, folder_uid, record_data,
                     creds.app_owner_public_key, creds.client_id, payload,
                     error)) {
    LogFailure("create_secret", error);
    return false;
  }
  payload.client_version = options_.client_version;
  std::vector<std::uint8_t> plain;
  if (!PostQuery(Endpoint::kCreateSecret, ToJson(payload), creds, plain,
                 error)) {
    LogFailure("create_secret", error);
    return false;
  }
  out_uid = payload.record_uid;
  platform::log::Log(platform::log::Level::kInfo, kTag, "record created",
                     {{"uid", out_uid}, {"folder", payload.folder_uid}});
  return true;
}

bool SecretsClient::DeleteSecrets(const std::vector<std::string>& uids,
                                  std::vector<std::string>& out_deleted,
                                  Error& error) {
  out_deleted.clear();
  if (uids.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "no records to delete");
  }
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  DeletePayload payload;
  payload.client_version = options_.client_version;
  payload.client_id = creds.client_id;
  payload.record_uids = uids;
  std::vector<std::uint8_t> plain;
  json response;
  if (!PostQuery(Endpoint::kDeleteSecret, ToJson(payload), creds, plain,
                 error) ||
      !ParseResponse(plain, response, error)) {
    LogFailure("delete_secret", error);
    return false;
  }
  const auto records = response.find("records");
  if (records == response.end() || !records->is_array()) {
    return true;
  }
  for (const auto& entry : *records) {
    if (!entry.is_object()) continue;
    const std::string uid = entry.value("recordUid", std::string());
    const std::string code = entry.value("responseCode", std::string());
    if (code == "ok") {
      out_deleted.push_back(uid);
    } else {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "record not deleted",
                         {{"uid", uid},
                          {"code", code},
                          {"detail", entry.value("errorMessage",
                                                 std::string())}});
    }
  }
  return true;
}

bool SecretsClient::DownloadFile(const KeeperFile& file,
                                 std::vector<std::uint8_t>& out,
                                 Error& error) {
  if (file.url.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "file " + file.uid + " has no url");
  }
  HttpResponse response;
  if (!options_.transport->Get(file.url, response, error)) {
    return false;
  }
  if (response.status != 200) {
    return Fail(error, ErrorCode::kServer,
                "file download failed with status " +
                    std::to_string(response.status));
  }
  return DecryptFileContent(file, response.body, out, error);
}

bool SecretsClient::CreateFolder(const std::string& parent_folder_uid,
                                 const std::string& name,
                                 std::string& out_uid, Error& error) {
  out_uid.clear();
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  std::vector<KeeperFolder> folders;
  if (!GetFolders(folders, error)) {
    return false;
  }
  CreateFolderPayload payload;
  if (!PrepareCreateFolder(folders, parent_folder_uid, name, creds.client_id,
                           payload, error)) {
    LogFailure("create_folder", error);
    return false;
  }
  payload.client_version = options_.client_version;
  std::vector<std::uint8_t> plain;
  if (!PostQuery(Endpoint::kCreateFolder, ToJson(payload), creds, plain,
                 error)) {
    LogFailure("create_folder", error);
    return false;
  }
  out_uid = payload.folder_uid;
  platform::log::Log(platform::log::Level::kInfo, kTag, "folder created",
                     {{"uid", out_uid},
                      {"shared_folder", payload.shared_folder_uid}});
  return true;
}

bool SecretsClient::UpdateFolder(const std::string& folder_uid,
                                 const std::string& name, Error& error) {
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  std::vector<KeeperFolder> folders;
  if (!GetFolders(folders, error)) {
    return false;
  }
  UpdateFolderPayload payload;
  if (!PrepareUpdateFolder(folders, folder_uid, name, creds.client_id,
                           payload, error)) {
    LogFailure("update_folder", error);
    return false;
  }
  payload.client_version = options_.client_version;
  std::vector<std::uint8_t> plain;
  if (!PostQuery(Endpoint::kUpdateFolder, ToJson(payload), creds, plain,
                 error)) {
    LogFailure("update_folder", error);
    return false;
  }
  return true;
}

bool SecretsClient::DeleteFolders(const std::vector<std::string>& uids,
                                  bool force,
                                  std::vector<std::string>& out_deleted,
                                  Error& error) {
  out_deleted.clear();
  if (uids.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "no folders to delete");
  }
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  DeleteFolderPayload payload;
  payload.client_version = options_.client_version;
  payload.client_id = creds.client_id;
  payload.folder_uids = uids;
  payload.force_deletion = force;
  std::vector<std::uint8_t> plain;
  json response;
  if (!PostQuery(Endpoint::kDeleteFolder, ToJson(payload), creds, plain,
                 error) ||
      !ParseResponse(plain, response, error)) {
    LogFailure("delete_folder", error);
    return false;
  }
  const auto folders = response.find("folders");
  if (folders == response.end() || !folders->is_array()) {
    return true;
  }
  for (const auto& entry : *folders) {
    if (!entry.is_object()) continue;
    const std::string uid = entry.value("folderUid", std::string());
    const std::string code = entry.value("responseCode", std::string());
    if (code == "ok") {
      out_deleted.push_back(uid);
    } else {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "folder not deleted",
                         {{"uid", uid},
                          {"code", code},
                          {"detail", entry.value("errorMessage",
                                                 std::string())}});
    }
  }
  return true;
}

bool SecretsClient::UploadFile(RecordGraph& graph,
                               const std::string& owner_uid,
                               const FileUpload& upload,
                               std::string& out_file_uid, Error& error) {
  out_file_uid.clear();
  KeeperRecord* owner = graph.FindRecord(owner_uid);
  if (!owner) {
    return Fail(error, ErrorCode::kRecordNotFound,
                "record " + owner_uid + " not in graph");
  }
  DeviceCredentials creds;
  if (!LoadCredentials(creds, error)) {
    return false;
  }
  PreparedFileUpload prepared;
  if (!PrepareFileUpload(*owner, upload, creds.app_owner_public_key,
                         creds.client_id, prepared, error)) {
    LogFailure("add_file", error);
    return false;
  }
  prepared.payload.client_version = options_.client_version;

  std::vector<std::uint8_t> plain;
  json response;
  if (!PostQuery(Endpoint::kAddFile, ToJson(prepared.payload), creds, plain,
                 error) ||
      !ParseResponse(plain, response, error)) {
    LogFailure("add_file", error);
    return false;
  }
  const std::string url = response.value("url", std::string());
  if (url.empty()) {
    error.Set(ErrorCode::kServer, "add_file response has no upload url");
    LogFailure("add_file", error);
    return false;
  }
  // The signed form fields arrive as a json object serialized to a string.
  HttpHeaders fields;
  const std::string parameters = response.value("parameters", std::string());
  if (!parameters.empty()) {
    const json form = json::parse(parameters, nullptr, false);
    if (form.is_discarded() || !form.is_object()) {
      error.Set(ErrorCode::kServer, "upload parameters are not a json object");
      LogFailure("add_file", error);
      return false;
    }
    for (const auto& item : form.items()) {
      fields.emplace_back(item.key(), item.value().is_string()
                                          ? item.value().get<std::string>()
                                          : item.value().dump());
    }
  }

  HttpResponse upload_response;
  if (!options_.transport->Upload(url, fields, prepared.encrypted_content,
                                  upload_response, error)) {
    LogFailure("upload", error);
    return false;
  }
  if (upload_response.status < 200 || upload_response.status >= 300) {
    error.Set(ErrorCode::kServer, "file upload failed with status " +
                                      std::to_string(upload_response.status));
    LogFailure("upload", error);
    return false;
  }

  out_file_uid = prepared.payload.file_record_uid;
  owner->data = std::move(prepared.owner_data);
  owner->revision_pending = true;
  platform::log::Log(platform::log::Level::kInfo, kTag, "file uploaded",
                     {{"uid", out_file_uid},
                      {"record", owner_uid},
                      {"bytes", std::to_string(upload.data.size())}});
  if (!RefreshRecord(*owner, true)) {
    platform::log::Log(platform::log::Level::kWarn, kTag,
                       "file linked but record not refreshed",
                       {{"uid", owner->uid}});
  }
  return true;
}

bool SecretsClient::FetchForNotation(const std::string& selector,
                                     RecordGraph& out, Error& error) {
  if (!GetSecrets({selector}, out, error)) {
    return false;
  }
  if (out.FindRecord(selector)) {
    return true;
  }
  // Not a uid; titles need the full set.
  return GetSecrets({}, out, error);
}

bool SecretsClient::GetNotation(const std::string& notation,
                                std::optional<std::vector<std::string>>& out,
                                Error& error) {
  out.reset();
  NotationQuery query;
  if (!NotationQuery::Parse(notation, query, error)) {
    return false;
  }
  RecordGraph graph;
  if (!FetchForNotation(query.record(), graph, error)) {
    return false;
  }
  const FileFetcher fetch = [this](const KeeperFile& file,
                                   std::vector<std::uint8_t>& content,
                                   Error& fetch_error) {
    return DownloadFile(file, content, fetch_error);
  };
  return ResolveNotation(graph, query, fetch, out, error);
}

bool SecretsClient::SetNotationValue(const std::string& notation,
                                     const std::string& value, Error& error) {
  NotationQuery query;
  if (!NotationQuery::Parse(notation, query, error)) {
    return false;
  }
  RecordGraph graph;
  if (!FetchForNotation(query.record(), graph, error)) {
    return false;
  }
  const KeeperRecord* record = nullptr;
  if (!FindNotationRecord(graph, query.record(), record, error)) {
    return false;
  }
  const std::string uid = record->uid;
  if (!core::SetNotationValue(graph, query, value, error)) {
    return false;
  }
  return UpdateSecret(graph, uid, std::nullopt, error);
}

}  // namespace ksm::core
