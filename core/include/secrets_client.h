#ifndef KSM_SECRETS_CLIENT_H
#define KSM_SECRETS_CLIENT_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "binding.h"
#include "client_config.h"
#include "config_store.h"
#include "error.h"
#include "http_transport.h"
#include "notation.h"
#include "payload_codec.h"
#include "record_codec.h"
#include "server_keys.h"

namespace ksm::core {

struct SecretsClientOptions {
  // Must already be loaded.
  std::shared_ptr<ConfigStore> store;
  // Redeemed during Init when present.
  std::optional<std::string> token;
  // Overrides the stored hostname for every request.
  std::optional<std::string> hostname;
  std::optional<std::uint32_t> server_public_key_id;
  bool force_rebind{false};
  // Defaults to HttpsTransport built from the fields below.
  std::shared_ptr<HttpTransport> transport;
  // Defaults to ServerKeyTable::Production(); must outlive the client.
  const ServerKeyTable* key_table{nullptr};
  std::string client_version{kClientVersion};
  bool verify_ssl{true};
  std::string ca_bundle;
  std::uint32_t timeout_ms{30000};
  std::optional<std::filesystem::path> cache_path;
};

SecretsClientOptions MakeClientOptions(const ClientConfig& config,
                                       std::shared_ptr<ConfigStore> store);

// Every call builds its own transmission key; shared state lives in the
// store only.
class SecretsClient {
 public:
  explicit SecretsClient(SecretsClientOptions options);

  SecretsClient(const SecretsClient&) = delete;
  SecretsClient& operator=(const SecretsClient&) = delete;

  bool Init(Error& error);

  // An empty uid list fetches everything shared with the application. The
  // first call on a binding store completes the binding.
  bool GetSecrets(const std::vector<std::string>& uids, RecordGraph& out,
                  Error& error);
  bool GetSecretsByTitle(const std::string& title,
                         std::vector<std::string>& out_uids,
                         RecordGraph& out, Error& error);
  bool GetFolders(std::vector<KeeperFolder>& out, Error& error);

  // On success the record's revision is advanced from the response, or
  // from a fetch of the record. If neither is available the record stays
  // revision_pending.
  bool UpdateSecret(RecordGraph& graph, const std::string& uid,
                    std::optional<TransactionType> transaction_type,
                    Error& error);
  bool CompleteTransaction(const std::string& uid, bool rollback,
                           Error& error);
  bool CreateSecret(const std::string& folder_uid,
                    const nlohmann::json& record_data, std::string& out_uid,
                    Error& error);
  bool DeleteSecrets(const std::vector<std::string>& uids,
                     std::vector<std::string>& out_deleted, Error& error);
  bool DownloadFile(const KeeperFile& file, std::vector<std::uint8_t>& out,
                    Error& error);

  // parent_folder_uid must be a shared folder or a folder below one.
  bool CreateFolder(const std::string& parent_folder_uid,
                    const std::string& name, std::string& out_uid,
                    Error& error);
  bool UpdateFolder(const std::string& folder_uid, const std::string& name,
                    Error& error);
  // Without force the server refuses folders that are not empty.
  bool DeleteFolders(const std::vector<std::string>& uids, bool force,
                     std::vector<std::string>& out_deleted, Error& error);

  // Encrypts and uploads a file, then links it to the owner record in
  // graph. The owner record is refreshed from the server afterwards; if
  // that fails it keeps the new fileRef and stays revision_pending.
  bool UploadFile(RecordGraph& graph, const std::string& owner_uid,
                  const FileUpload& upload, std::string& out_file_uid,
                  Error& error);

  bool GetNotation(const std::string& notation,
                   std::optional<std::vector<std::string>>& out, Error& error);
  // Sets the addressed field and saves the record.
  bool SetNotationValue(const std::string& notation, const std::string& value,
                        Error& error);

 private:
  bool LoadCredentials(DeviceCredentials& out, Error& error) const;
  bool PostQuery(Endpoint endpoint, const std::string& payload_json,
                 DeviceCredentials& creds,
                 std::vector<std::uint8_t>& out_plain, Error& error);
  bool FetchSecrets(const std::vector<std::string>& uids, RecordGraph& out,
                    bool& just_bound, Error& error);
  bool RefreshRecord(KeeperRecord& record, bool replace_data);
  bool FetchForNotation(const std::string& selector, RecordGraph& out,
                        Error& error);

  SecretsClientOptions options_;
  const ServerKeyTable* key_table_{nullptr};
};

}  // namespace ksm::core

#endif  // KSM_SECRETS_CLIENT_H
