#include "record_codec.h"

#include <unordered_map>
#include <utility>

#include "crypto.h"
#include "encoding_utils.h"
#include "platform_log.h"
#include "platform_random.h"
#include "platform_time.h"

namespace ksm::core {

namespace {

using nlohmann::json;

constexpr char kTag[] = "record_codec";
constexpr std::size_t kUidBytes = 16;

std::string StringOr(const json& obj, const char* key,
                     const std::string& fallback = {}) {
  if (!obj.is_object()) return fallback;
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

std::int64_t IntOr(const json& obj, const char* key, std::int64_t fallback) {
  if (!obj.is_object()) return fallback;
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return fallback;
  return it->get<std::int64_t>();
}

bool DecodeBase64Member(const json& obj, const char* key,
                        std::vector<std::uint8_t>& out, Error& error) {
  const std::string text = StringOr(obj, key);
  if (text.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                std::string(key) + " missing");
  }
  if (!common::Base64Decode(text, out)) {
    return Fail(error, ErrorCode::kServer,
                std::string(key) + " is not base64");
  }
  return true;
}

bool UnwrapKey(const json& obj, const char* key,
               const common::SecureBuffer& wrapping_key,
               common::SecureBuffer& out, Error& error) {
  std::vector<std::uint8_t> wrapped;
  if (!DecodeBase64Member(obj, key, wrapped, error)) {
    return false;
  }
  std::vector<std::uint8_t> raw;
  if (!crypto::AesGcmDecrypt(wrapped, wrapping_key, raw, error)) {
    return false;
  }
  out = common::SecureBuffer(std::move(raw));
  return true;
}

bool DecryptJson(const json& obj, const char* key,
                 const common::SecureBuffer& data_key, json& out,
                 Error& error) {
  std::vector<std::uint8_t> blob;
  if (!DecodeBase64Member(obj, key, blob, error)) {
    return false;
  }
  std::vector<std::uint8_t> plain;
  common::ScopedWipe wipe_plain(plain);
  if (!crypto::AesGcmDecrypt(blob, data_key, plain, error)) {
    return false;
  }
  out = json::parse(plain.begin(), plain.end(), nullptr, false);
  if (out.is_discarded() || !out.is_object()) {
    out = json::object();
    return Fail(error, ErrorCode::kServer, std::string(key) +
                                               " is not a json object");
  }
  return true;
}

const json* SectionArray(const json& data, FieldSection section) {
  const char* key = section == FieldSection::kStandard ? "fields" : "custom";
  if (!data.is_object()) return nullptr;
  const auto it = data.find(key);
  if (it == data.end() || !it->is_array()) return nullptr;
  return &*it;
}

void LogSkipped(const char* what, const std::string& uid,
                const Error& error) {
  platform::log::Log(platform::log::Level::kError, kTag, "skipping entry",
                     {{"kind", what},
                      {"uid", uid},
                      {"reason", ErrorCodeName(error.code)}});
}

bool SealJson(const json& doc, const std::uint8_t* key, std::size_t key_len,
              std::string& out, Error& error) {
  std::string text = doc.dump();
  std::vector<std::uint8_t> plain = common::StringToBytes(text);
  common::SecureWipe(text);
  common::ScopedWipe wipe_plain(plain);
  std::vector<std::uint8_t> sealed;
  if (!crypto::AesGcmEncrypt(plain, key, key_len, sealed, error)) {
    return false;
  }
  out = common::Base64UrlEncode(sealed);
  return true;
}

const KeeperFolder* FindFolderIn(const std::vector<KeeperFolder>& folders,
                                 const std::string& uid) {
  for (const auto& folder : folders) {
    if (folder.uid == uid) return &folder;
  }
  return nullptr;
}

void AppendFileRef(json& data, const std::string& file_uid) {
  if (!data.contains("fields") || !data["fields"].is_array()) {
    data["fields"] = json::array();
  }
  for (auto& field : data["fields"]) {
    if (!field.is_object() || field.value("type", std::string()) != "fileRef") {
      continue;
    }
    if (!field.contains("value") || !field["value"].is_array()) {
      field["value"] = json::array();
    }
    field["value"].push_back(file_uid);
    return;
  }
  data["fields"].push_back(
      {{"type", "fileRef"}, {"value", json::array({file_uid})}});
}

}  // namespace

std::string KeeperRecord::Title() const { return StringOr(data, "title"); }

std::string KeeperRecord::Type() const { return StringOr(data, "type"); }

std::optional<std::string> KeeperRecord::Notes() const {
  const auto it = data.find("notes");
  if (it == data.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

const json* KeeperRecord::FindField(FieldSection section,
                                    const std::string& name) const {
  const json* fields = SectionArray(data, section);
  if (!fields) return nullptr;
  for (const auto& field : *fields) {
    if (StringOr(field, "type") == name || StringOr(field, "label") == name) {
      return &field;
    }
  }
  return nullptr;
}

json* KeeperRecord::FindField(FieldSection section, const std::string& name) {
  return const_cast<json*>(
      static_cast<const KeeperRecord*>(this)->FindField(section, name));
}

std::optional<std::vector<json>> KeeperRecord::FieldValues(
    FieldSection section, const std::string& name) const {
  const json* field = FindField(section, name);
  if (!field) {
    return std::nullopt;
  }
  std::vector<json> values;
  const auto it = field->find("value");
  if (it == field->end() || it->is_null()) {
    return values;
  }
  if (it->is_array()) {
    values.assign(it->begin(), it->end());
  } else {
    values.push_back(*it);
  }
  return values;
}

bool KeeperRecord::SetFieldValue(FieldSection section, const std::string& name,
                                 const std::vector<json>& values,
                                 Error& error) {
  json* field = FindField(section, name);
  if (!field) {
    return Fail(error, ErrorCode::kMissingField,
                "field " + name + " not found in record " + uid);
  }
  (*field)["value"] = json(values);
  return true;
}

const KeeperFile* KeeperRecord::FindFile(
    const std::string& name_title_or_uid) const {
  for (const auto& file : files) {
    if (file.name == name_title_or_uid || file.title == name_title_or_uid ||
        file.uid == name_title_or_uid) {
      return &file;
    }
  }
  return nullptr;
}

void RecordGraph::AddRecord(KeeperRecord record) {
  const auto it = record_index_.find(record.uid);
  if (it != record_index_.end()) {
    records_[it->second] = std::move(record);
    return;
  }
  record_index_.emplace(record.uid, records_.size());
  records_.push_back(std::move(record));
}

void RecordGraph::AddFolder(KeeperFolder folder) {
  const auto it = folder_index_.find(folder.uid);
  if (it != folder_index_.end()) {
    folders_[it->second] = std::move(folder);
    return;
  }
  folder_index_.emplace(folder.uid, folders_.size());
  folders_.push_back(std::move(folder));
}

const KeeperRecord* RecordGraph::FindRecord(const std::string& uid) const {
  const auto it = record_index_.find(uid);
  return it == record_index_.end() ? nullptr : &records_[it->second];
}

KeeperRecord* RecordGraph::FindRecord(const std::string& uid) {
  const auto it = record_index_.find(uid);
  return it == record_index_.end() ? nullptr : &records_[it->second];
}

std::vector<const KeeperRecord*> RecordGraph::FindRecordsByTitle(
    const std::string& title) const {
  std::vector<const KeeperRecord*> out;
  for (const auto& record : records_) {
    if (record.Title() == title) {
      out.push_back(&record);
    }
  }
  return out;
}

const KeeperFolder* RecordGraph::FindFolder(const std::string& uid) const {
  const auto it = folder_index_.find(uid);
  return it == folder_index_.end() ? nullptr : &folders_[it->second];
}

bool DecryptFileMetadata(const json& file_json,
                         const common::SecureBuffer& record_key,
                         KeeperFile& out, Error& error) {
  out = KeeperFile{};
  out.uid = StringOr(file_json, "fileUid");
  if (!UnwrapKey(file_json, "fileKey", record_key, out.file_key, error)) {
    return false;
  }
  json meta;
  if (!DecryptJson(file_json, "data", out.file_key, meta, error)) {
    return false;
  }
  out.name = StringOr(meta, "name");
  out.title = StringOr(meta, "title");
  out.type = StringOr(meta, "type");
  out.size = IntOr(meta, "size", 0);
  out.last_modified = IntOr(meta, "lastModified", 0);
  out.url = StringOr(file_json, "url");
  out.thumbnail_url = StringOr(file_json, "thumbnailUrl");
  return true;
}

bool DecryptFileContent(const KeeperFile& file,
                        const std::vector<std::uint8_t>& encrypted,
                        std::vector<std::uint8_t>& out, Error& error) {
  if (file.file_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "file key missing for " + file.uid);
  }
  return crypto::AesGcmDecrypt(encrypted, file.file_key, out, error);
}

bool DecryptRecord(const json& record_json, common::SecureBuffer record_key,
                   const std::string& folder_uid, KeeperRecord& out,
                   Error& error) {
  out = KeeperRecord{};
  out.uid = StringOr(record_json, "recordUid");
  if (out.uid.empty()) {
    return Fail(error, ErrorCode::kServer, "recordUid missing");
  }
  if (!DecryptJson(record_json, "data", record_key, out.data, error)) {
    return false;
  }
  out.folder_uid = folder_uid;
  out.revision = IntOr(record_json, "revision", 0);
  const auto editable = record_json.find("isEditable");
  if (editable != record_json.end() && editable->is_boolean()) {
    out.is_editable = editable->get<bool>();
  }
  const auto files = record_json.find("files");
  if (files != record_json.end() && files->is_array()) {
    for (const auto& file_json : *files) {
      KeeperFile file;
      Error file_error;
      if (!DecryptFileMetadata(file_json, record_key, file, file_error)) {
        LogSkipped("file", StringOr(file_json, "fileUid"), file_error);
        continue;
      }
      out.files.push_back(std::move(file));
    }
  }
  out.record_key = std::move(record_key);
  return true;
}

bool DecodeSecretsResponse(const common::SecureBuffer& app_key,
                           const json& response, RecordGraph& out,
                           Error& error) {
  out = RecordGraph{};
  if (!response.is_object()) {
    return Fail(error, ErrorCode::kServer, "secrets response is not an object");
  }

  const auto add_record = [&out](const json& record_json,
                                 const common::SecureBuffer& wrapping_key,
                                 const std::string& folder_uid) {
    const std::string uid = StringOr(record_json, "recordUid");
    Error record_error;
    common::SecureBuffer record_key;
    if (StringOr(record_json, "recordKey").empty()) {
      // Single-record share: the app key is the record key.
      record_key = wrapping_key.Clone();
    } else if (!UnwrapKey(record_json, "recordKey", wrapping_key, record_key,
                          record_error)) {
      LogSkipped("record", uid, record_error);
      return;
    }
    KeeperRecord record;
    if (!DecryptRecord(record_json, std::move(record_key), folder_uid, record,
                       record_error)) {
      LogSkipped("record", uid, record_error);
      return;
    }
    out.AddRecord(std::move(record));
  };

  const auto records = response.find("records");
  if (records != response.end() && records->is_array()) {
    for (const auto& record_json : *records) {
      add_record(record_json, app_key, std::string());
    }
  }

  const auto folders = response.find("folders");
  if (folders != response.end() && folders->is_array()) {
    for (const auto& folder_json : *folders) {
      KeeperFolder folder;
      folder.uid = StringOr(folder_json, "folderUid");
      Error folder_error;
      if (!UnwrapKey(folder_json, "folderKey", app_key, folder.folder_key,
                     folder_error)) {
        LogSkipped("folder", folder.uid, folder_error);
        continue;
      }
      const auto folder_records = folder_json.find("records");
      if (folder_records != folder_json.end() && folder_records->is_array()) {
        for (const auto& record_json : *folder_records) {
          add_record(record_json, folder.folder_key, folder.uid);
        }
      }
      out.AddFolder(std::move(folder));
    }
  }

  const auto warnings = response.find("warnings");
  if (warnings != response.end() && warnings->is_array()) {
    for (const auto& warning : *warnings) {
      if (!warning.is_string()) continue;
      out.warnings.push_back(warning.get<std::string>());
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         out.warnings.back());
    }
  }
  const auto expires = response.find("expiresOn");
  if (expires != response.end() && expires->is_number()) {
    out.expires_on = expires->get<std::int64_t>();
  }
  if (!StringOr(response, "appData").empty()) {
    Error app_data_error;
    if (!DecryptJson(response, "appData", app_key, out.app_data,
                     app_data_error)) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "app data did not decrypt",
                         {{"reason", ErrorCodeName(app_data_error.code)}});
    }
  }
  platform::log::Log(platform::log::Level::kDebug, kTag, "decoded secrets",
                     {{"records", std::to_string(out.records().size())},
                      {"folders", std::to_string(out.folders().size())}});
  return true;
}

bool DecodeFoldersResponse(const common::SecureBuffer& app_key,
                           const json& response,
                           std::vector<KeeperFolder>& out, Error& error) {
  out.clear();
  if (!response.is_object()) {
    return Fail(error, ErrorCode::kServer, "folders response is not an object");
  }
  const auto folders = response.find("folders");
  if (folders == response.end() || !folders->is_array()) {
    return true;
  }

  std::unordered_map<std::string, const json*> by_uid;
  for (const auto& folder_json : *folders) {
    by_uid[StringOr(folder_json, "folderUid")] = &folder_json;
  }

  std::unordered_map<std::string, common::SecureBuffer> shared_keys;
  for (const auto& folder_json : *folders) {
    KeeperFolder folder;
    folder.uid = StringOr(folder_json, "folderUid");
    folder.parent_uid = StringOr(folder_json, "parent");

    // Walk to the shared folder at the top of the ancestry.
    const json* root = &folder_json;
    std::string root_uid = folder.uid;
    for (std::size_t hops = 0; !StringOr(*root, "parent").empty(); ++hops) {
      const std::string parent = StringOr(*root, "parent");
      const auto it = by_uid.find(parent);
      if (it == by_uid.end() || hops > by_uid.size()) {
        return Fail(error, ErrorCode::kKeyUnavailable,
                    "folder " + folder.uid + " has no resolvable shared folder");
      }
      root = it->second;
      root_uid = parent;
    }

    Error folder_error;
    if (root_uid == folder.uid) {
      if (!UnwrapKey(folder_json, "folderKey", app_key, folder.folder_key,
                     folder_error)) {
        LogSkipped("folder", folder.uid, folder_error);
        continue;
      }
    } else {
      auto shared = shared_keys.find(root_uid);
      if (shared == shared_keys.end()) {
        common::SecureBuffer root_key;
        if (!UnwrapKey(*root, "folderKey", app_key, root_key, folder_error)) {
          LogSkipped("folder", folder.uid, folder_error);
          continue;
        }
        shared = shared_keys.emplace(root_uid, std::move(root_key)).first;
      }
      if (!UnwrapKey(folder_json, "folderKey", shared->second,
                     folder.folder_key, folder_error)) {
        LogSkipped("folder", folder.uid, folder_error);
        continue;
      }
    }

    if (!StringOr(folder_json, "data").empty()) {
      json data;
      if (DecryptJson(folder_json, "data", folder.folder_key, data,
                      folder_error)) {
        folder.name = StringOr(data, "name");
      } else {
        LogSkipped("folder name", folder.uid, folder_error);
      }
    }
    out.push_back(std::move(folder));
  }
  return true;
}

bool PrepareUpdate(const RecordGraph& graph, const KeeperRecord& record,
                   const std::string& client_id,
                   std::optional<TransactionType> transaction_type,
                   UpdatePayload& out, Error& error) {
  if (record.revision_pending) {
    return Fail(error, ErrorCode::kRevisionConflict,
                "record " + record.uid +
                    " has an unacknowledged update; fetch it again");
  }
  if (record.record_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "record key missing for " + record.uid);
  }
  if (!record.folder_uid.empty()) {
    const KeeperFolder* folder = graph.FindFolder(record.folder_uid);
    if (!folder || folder->folder_key.empty()) {
      return Fail(error, ErrorCode::kKeyUnavailable,
                  "folder key missing for " + record.folder_uid);
    }
  }

  std::string text = record.data.dump();
  std::vector<std::uint8_t> plain = common::StringToBytes(text);
  common::SecureWipe(text);
  common::ScopedWipe wipe_plain(plain);
  std::vector<std::uint8_t> encrypted;
  if (!crypto::AesGcmEncrypt(plain, record.record_key, encrypted, error)) {
    return false;
  }

  out = UpdatePayload{};
  out.client_id = client_id;
  out.record_uid = record.uid;
  out.revision = record.revision;
  out.data = common::Base64UrlEncode(encrypted);
  out.transaction_type = transaction_type;
  return true;
}

bool FindSharedFolder(const std::vector<KeeperFolder>& folders,
                      const std::string& folder_uid,
                      const KeeperFolder*& out, Error& error) {
  out = nullptr;
  const auto find = [&folders](const std::string& uid) -> const KeeperFolder* {
    for (const auto& folder : folders) {
      if (folder.uid == uid) return &folder;
    }
    return nullptr;
  };
  const KeeperFolder* current = find(folder_uid);
  for (std::size_t hops = 0; current && !current->parent_uid.empty(); ++hops) {
    if (hops > folders.size()) {
      current = nullptr;
      break;
    }
    current = find(current->parent_uid);
  }
  if (!current || current->folder_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "no shared folder key for folder " + folder_uid);
  }
  out = current;
  return true;
}

bool PrepareCreateFolder(const std::vector<KeeperFolder>& folders,
                         const std::string& parent_folder_uid,
                         const std::string& name,
                         const std::string& client_id,
                         CreateFolderPayload& out, Error& error) {
  if (name.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "folder name empty");
  }
  const KeeperFolder* shared = nullptr;
  if (!FindSharedFolder(folders, parent_folder_uid, shared, error)) {
    return false;
  }

  std::vector<std::uint8_t> folder_key;
  common::ScopedWipe wipe_folder_key(folder_key);
  if (!platform::RandomBytes(crypto::kAesKeyBytes, folder_key)) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  std::string folder_uid;
  if (!GenerateUid(folder_uid, error)) {
    return false;
  }
  std::vector<std::uint8_t> wrapped_key;
  if (!crypto::AesGcmEncrypt(folder_key, shared->folder_key, wrapped_key,
                             error)) {
    return false;
  }
  std::string data;
  if (!SealJson({{"name", name}}, folder_key.data(), folder_key.size(), data,
                error)) {
    return false;
  }

  out = CreateFolderPayload{};
  out.client_id = client_id;
  out.folder_uid = folder_uid;
  out.shared_folder_uid = shared->uid;
  out.shared_folder_key = common::Base64UrlEncode(wrapped_key);
  out.data = std::move(data);
  if (shared->uid != parent_folder_uid) {
    out.parent_uid = parent_folder_uid;
  }
  return true;
}

bool PrepareUpdateFolder(const std::vector<KeeperFolder>& folders,
                         const std::string& folder_uid,
                         const std::string& name,
                         const std::string& client_id,
                         UpdateFolderPayload& out, Error& error) {
  if (name.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "folder name empty");
  }
  const KeeperFolder* folder = FindFolderIn(folders, folder_uid);
  if (!folder || folder->folder_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "folder key missing for " + folder_uid);
  }
  out = UpdateFolderPayload{};
  if (!SealJson({{"name", name}}, folder->folder_key.data(),
                folder->folder_key.size(), out.data, error)) {
    return false;
  }
  out.client_id = client_id;
  out.folder_uid = folder_uid;
  return true;
}

bool PrepareFileUpload(const KeeperRecord& owner, const FileUpload& upload,
                       const std::vector<std::uint8_t>& owner_public_key,
                       const std::string& client_id,
                       PreparedFileUpload& out, Error& error) {
  if (upload.name.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "file name empty");
  }
  if (owner.record_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "record key missing for " + owner.uid);
  }
  if (owner_public_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "application owner public key missing");
  }

  std::vector<std::uint8_t> file_key;
  common::ScopedWipe wipe_file_key(file_key);
  if (!platform::RandomBytes(crypto::kAesKeyBytes, file_key)) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  std::string file_uid;
  if (!GenerateUid(file_uid, error)) {
    return false;
  }

  const json meta = {{"name", upload.name},
                     {"title", upload.title.empty() ? upload.name
                                                    : upload.title},
                     {"type", upload.mime_type},
                     {"size", upload.data.size()},
                     {"lastModified", platform::NowUnixMs()}};
  std::string file_data;
  if (!SealJson(meta, file_key.data(), file_key.size(), file_data, error)) {
    return false;
  }
  std::vector<std::uint8_t> key_for_owner;
  if (!crypto::PublicEncrypt(file_key, owner_public_key, {}, key_for_owner,
                             error)) {
    return false;
  }
  std::vector<std::uint8_t> link_key;
  if (!crypto::AesGcmEncrypt(file_key, owner.record_key, link_key, error)) {
    return false;
  }
  std::vector<std::uint8_t> content;
  if (!crypto::AesGcmEncrypt(upload.data, file_key.data(), file_key.size(),
                             content, error)) {
    return false;
  }

  json owner_data = owner.data;
  AppendFileRef(owner_data, file_uid);
  std::string sealed_owner;
  if (!SealJson(owner_data, owner.record_key.data(), owner.record_key.size(),
                sealed_owner, error)) {
    return false;
  }

  out = PreparedFileUpload{};
  out.payload.client_id = client_id;
  out.payload.file_record_uid = file_uid;
  out.payload.file_record_key = common::Base64Encode(key_for_owner);
  out.payload.file_record_data = std::move(file_data);
  out.payload.owner_record_uid = owner.uid;
  out.payload.owner_record_data = std::move(sealed_owner);
  out.payload.link_key = common::Base64Encode(link_key);
  out.payload.file_size = content.size();
  out.encrypted_content = std::move(content);
  out.owner_data = std::move(owner_data);
  return true;
}

bool GenerateUid(std::string& out, Error& error) {
  std::vector<std::uint8_t> raw;
  if (!platform::RandomBytes(kUidBytes, raw)) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  out = common::Base64UrlEncode(raw);
  return true;
}

bool PrepareCreate(const std::vector<KeeperFolder>& folders,
                   const std::string& folder_uid, const json& record_data,
                   const std::vector<std::uint8_t>& owner_public_key,
                   const std::string& client_id, CreatePayload& out,
                   Error& error) {
  if (!record_data.is_object()) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "record data must be a json object");
  }
  if (owner_public_key.empty()) {
    return Fail(error, ErrorCode::kKeyUnavailable,
                "application owner public key missing");
  }
  const KeeperFolder* shared = nullptr;
  if (!FindSharedFolder(folders, folder_uid, shared, error)) {
    return false;
  }

  std::vector<std::uint8_t> record_key;
  common::ScopedWipe wipe_record_key(record_key);
  if (!platform::RandomBytes(crypto::kAesKeyBytes, record_key)) {
    return Fail(error, ErrorCode::kCrypto, "rng failed");
  }
  std::string record_uid;
  if (!GenerateUid(record_uid, error)) {
    return false;
  }

  std::string text = record_data.dump();
  std::vector<std::uint8_t> plain = common::StringToBytes(text);
  common::SecureWipe(text);
  common::ScopedWipe wipe_plain(plain);
  std::vector<std::uint8_t> encrypted_data;
  if (!crypto::AesGcmEncrypt(plain, record_key.data(), record_key.size(),
                             encrypted_data, error)) {
    return false;
  }
  std::vector<std::uint8_t> key_for_owner;
  if (!crypto::PublicEncrypt(record_key, owner_public_key, {}, key_for_owner,
                             error)) {
    return false;
  }
  std::vector<std::uint8_t> key_for_folder;
  if (!crypto::AesGcmEncrypt(record_key, shared->folder_key, key_for_folder,
                             error)) {
    return false;
  }

  out = CreatePayload{};
  out.client_id = client_id;
  out.record_uid = record_uid;
  out.record_key = common::Base64Encode(key_for_owner);
  out.folder_uid = shared->uid;
  out.folder_key = common::Base64Encode(key_for_folder);
  out.data = common::Base64Encode(encrypted_data);
  if (shared->uid != folder_uid) {
    out.sub_folder_uid = folder_uid;
  }
  return true;
}

}  // namespace ksm::core
