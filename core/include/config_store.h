#ifndef KSM_CONFIG_STORE_H
#define KSM_CONFIG_STORE_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

#include "error.h"

namespace ksm::core {

namespace config_keys {
constexpr char kUrl[] = "url";
constexpr char kHostname[] = "hostname";
constexpr char kClientId[] = "clientId";
constexpr char kClientKey[] = "clientKey";
constexpr char kAppKey[] = "appKey";
constexpr char kAppOwnerPublicKey[] = "appOwnerPublicKey";
constexpr char kPrivateKey[] = "privateKey";
constexpr char kServerPublicKeyId[] = "serverPublicKeyId";
constexpr char kBoundFlag[] = "boundFlag";
}  // namespace config_keys

using ConfigMap = std::map<std::string, std::string>;

// Storage media. The JSON file persists writes, memory and blob media keep
// them in process memory, and the environment medium refuses them.
struct MemoryBackend {
  ConfigMap initial;
};

struct JsonFileBackend {
  std::filesystem::path path;
  std::uint32_t lock_timeout_ms{5000};
};

// KSM_CONFIG holds a base64 JSON blob; otherwise each key is read from
// <prefix><UPPERCASE KEY>, e.g. KSM_CLIENTID.
struct EnvironmentBackend {
  std::string prefix{"KSM_"};
};

struct Base64BlobBackend {
  std::string blob;
};

using StorageMedium = std::variant<MemoryBackend, JsonFileBackend,
                                   EnvironmentBackend, Base64BlobBackend>;

class ConfigStore {
 public:
  using Mutator = std::function<bool(ConfigMap& values, Error& error)>;

  explicit ConfigStore(StorageMedium medium);

  ConfigStore(const ConfigStore&) = delete;
  ConfigStore& operator=(const ConfigStore&) = delete;

  // Reads the medium. A missing JSON file is an empty store.
  bool Load(Error& error);

  std::optional<std::string> Get(const std::string& key) const;
  bool Contains(const std::string& key) const;
  std::vector<std::string> List() const;
  ConfigMap Snapshot() const;

  bool Set(const std::string& key, const std::string& value, Error& error);
  bool Delete(const std::string& key, Error& error);

  // Atomic read-modify-write under the single-writer lock. For the JSON
  // file the on-disk copy is re-read under the file lock first. Nothing is
  // persisted if the mutator fails.
  bool Update(const Mutator& mutator, Error& error);

  // Base64 of the JSON document, the format the CLI hands out.
  std::string ExportBase64() const;

  bool persistent() const;
  bool read_only() const;

 private:
  bool UpdateLocked(const Mutator& mutator, Error& error);
  bool ReadMedium(ConfigMap& out, Error& error) const;
  bool WriteMedium(const ConfigMap& values, Error& error) const;

  StorageMedium medium_;
  mutable std::shared_mutex mutex_;
  ConfigMap values_;
};

bool ParseConfigJson(const std::string& text, ConfigMap& out, Error& error);
std::string SerializeConfigJson(const ConfigMap& values);

}  // namespace ksm::core

#endif  // KSM_CONFIG_STORE_H
