#ifndef KSM_RECORD_CODEC_H
#define KSM_RECORD_CODEC_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.h"
#include "payload_codec.h"
#include "secure_buffer.h"

namespace ksm::core {

enum class FieldSection : std::uint8_t { kStandard = 0, kCustom = 1 };

struct KeeperFile {
  std::string uid;
  common::SecureBuffer file_key;
  std::string name;
  std::string title;
  std::string type;
  std::int64_t size{0};
  std::int64_t last_modified{0};
  std::string url;
  std::string thumbnail_url;
};

struct KeeperRecord {
  std::string uid;
  // Empty for records shared directly with the application.
  std::string folder_uid;
  std::int64_t revision{0};
  bool is_editable{true};
  // Set after an update until the server-acknowledged revision is known.
  bool revision_pending{false};
  common::SecureBuffer record_key;
  nlohmann::json data = nlohmann::json::object();
  std::vector<KeeperFile> files;

  std::string Title() const;
  std::string Type() const;
  std::optional<std::string> Notes() const;

  // First field whose type or label equals name, in document order.
  const nlohmann::json* FindField(FieldSection section,
                                  const std::string& name) const;
  nlohmann::json* FindField(FieldSection section, const std::string& name);

  // nullopt when no field matches. A field without "value" yields [].
  std::optional<std::vector<nlohmann::json>> FieldValues(
      FieldSection section, const std::string& name) const;
  bool SetFieldValue(FieldSection section, const std::string& name,
                     const std::vector<nlohmann::json>& values, Error& error);

  const KeeperFile* FindFile(const std::string& name_title_or_uid) const;
};

struct KeeperFolder {
  std::string uid;
  // Empty for a shared folder.
  std::string parent_uid;
  std::string name;
  common::SecureBuffer folder_key;
};

// Flat storage with uid indexes; folders reference parents by uid only.
class RecordGraph {
 public:
  RecordGraph() = default;
  RecordGraph(RecordGraph&&) = default;
  RecordGraph& operator=(RecordGraph&&) = default;
  RecordGraph(const RecordGraph&) = delete;
  RecordGraph& operator=(const RecordGraph&) = delete;

  void AddRecord(KeeperRecord record);
  void AddFolder(KeeperFolder folder);

  const std::vector<KeeperRecord>& records() const { return records_; }
  const std::vector<KeeperFolder>& folders() const { return folders_; }

  const KeeperRecord* FindRecord(const std::string& uid) const;
  KeeperRecord* FindRecord(const std::string& uid);
  std::vector<const KeeperRecord*> FindRecordsByTitle(
      const std::string& title) const;
  const KeeperFolder* FindFolder(const std::string& uid) const;

  std::vector<std::string> warnings;
  std::optional<std::int64_t> expires_on;
  nlohmann::json app_data;

 private:
  std::vector<KeeperRecord> records_;
  std::vector<KeeperFolder> folders_;
  std::unordered_map<std::string, std::size_t> record_index_;
  std::unordered_map<std::string, std::size_t> folder_index_;
};

// Records whose keys or data do not decrypt are logged and skipped.
bool DecodeSecretsResponse(const common::SecureBuffer& app_key,
                           const nlohmann::json& response, RecordGraph& out,
                           Error& error);

// Shared folders unwrap with the app key, nested ones with the key of
// their shared-folder ancestor.
bool DecodeFoldersResponse(const common::SecureBuffer& app_key,
                           const nlohmann::json& response,
                           std::vector<KeeperFolder>& out, Error& error);

bool DecryptRecord(const nlohmann::json& record_json,
                   common::SecureBuffer record_key,
                   const std::string& folder_uid, KeeperRecord& out,
                   Error& error);

bool DecryptFileMetadata(const nlohmann::json& file_json,
                         const common::SecureBuffer& record_key,
                         KeeperFile& out, Error& error);

bool DecryptFileContent(const KeeperFile& file,
                        const std::vector<std::uint8_t>& encrypted,
                        std::vector<std::uint8_t>& out, Error& error);

bool PrepareUpdate(const RecordGraph& graph, const KeeperRecord& record,
                   const std::string& client_id,
                   std::optional<TransactionType> transaction_type,
                   UpdatePayload& out, Error& error);

// Finds the shared folder at the top of folder_uid's ancestry.
bool FindSharedFolder(const std::vector<KeeperFolder>& folders,
                      const std::string& folder_uid,
                      const KeeperFolder*& out, Error& error);

bool PrepareCreate(const std::vector<KeeperFolder>& folders,
                   const std::string& folder_uid,
                   const nlohmann::json& record_data,
                   const std::vector<std::uint8_t>& owner_public_key,
                   const std::string& client_id, CreatePayload& out,
                   Error& error);

// parent_folder_uid is the shared folder itself or any folder below it.
// The new folder's key is wrapped by the shared folder key.
bool PrepareCreateFolder(const std::vector<KeeperFolder>& folders,
                         const std::string& parent_folder_uid,
                         const std::string& name,
                         const std::string& client_id,
                         CreateFolderPayload& out, Error& error);

bool PrepareUpdateFolder(const std::vector<KeeperFolder>& folders,
                         const std::string& folder_uid,
                         const std::string& name,
                         const std::string& client_id,
                         UpdateFolderPayload& out, Error& error);

struct FileUpload {
  std::string name;
  std::string title;
  std::string mime_type{"application/octet-stream"};
  std::vector<std::uint8_t> data;
};

struct PreparedFileUpload {
  FileUploadPayload payload;
  std::vector<std::uint8_t> encrypted_content;
  // Owner record data with the new uid appended to its fileRef field.
  nlohmann::json owner_data;
};

bool PrepareFileUpload(const KeeperRecord& owner, const FileUpload& upload,
                       const std::vector<std::uint8_t>& owner_public_key,
                       const std::string& client_id,
                       PreparedFileUpload& out, Error& error);

// 16 random bytes, url-safe base64 without padding.
bool GenerateUid(std::string& out, Error& error);

}  // namespace ksm::core

#endif  // KSM_RECORD_CODEC_H
