#include "config_store.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <utility>

#include "encoding_utils.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace ksm::core {

namespace {

constexpr char kTag[] = "config_store";
constexpr char kEnvBlobSuffix[] = "CONFIG";

constexpr const char* kKnownKeys[] = {
    config_keys::kUrl,          config_keys::kHostname,
    config_keys::kClientId,     config_keys::kClientKey,
    config_keys::kAppKey,       config_keys::kAppOwnerPublicKey,
    config_keys::kPrivateKey,   config_keys::kServerPublicKeyId,
    config_keys::kBoundFlag,
};

std::string ToUpper(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return s;
}

void WipeValues(ConfigMap& values) {
  for (auto& kv : values) {
    common::SecureWipe(kv.second);
  }
  values.clear();
}

bool DecodeBlob(const std::string& blob, ConfigMap& out, Error& error) {
  std::vector<std::uint8_t> raw;
  if (!common::Base64Decode(blob, raw)) {
    return Fail(error, ErrorCode::kStorage, "config blob is not base64");
  }
  std::string text(raw.begin(), raw.end());
  common::SecureWipe(raw);
  common::ScopedWipe wipe_text(text);
  return ParseConfigJson(text, out, error);
}

}  // namespace

bool ParseConfigJson(const std::string& text, ConfigMap& out, Error& error) {
  out.clear();
  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return Fail(error, ErrorCode::kStorage, "config is not a json object");
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const auto& v = it.value();
    if (v.is_string()) {
      out[it.key()] = v.get<std::string>();
    } else if (v.is_boolean()) {
      out[it.key()] = v.get<bool>() ? "true" : "false";
    } else if (v.is_number()) {
      out[it.key()] = v.dump();
    } else if (!v.is_null()) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "ignoring non-scalar config entry",
                         {{"entry", it.key()}});
    }
  }
  return true;
}

std::string SerializeConfigJson(const ConfigMap& values) {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto& kv : values) {
    doc[kv.first] = kv.second;
  }
  return doc.dump(4);
}

ConfigStore::ConfigStore(StorageMedium medium) : medium_(std::move(medium)) {
  if (const auto* mem = std::get_if<MemoryBackend>(&medium_)) {
    values_ = mem->initial;
  }
}

bool ConfigStore::persistent() const {
  return std::holds_alternative<JsonFileBackend>(medium_);
}

bool ConfigStore::read_only() const {
  return std::holds_alternative<EnvironmentBackend>(medium_);
}

bool ConfigStore::ReadMedium(ConfigMap& out, Error& error) const {
  out.clear();
  if (const auto* mem = std::get_if<MemoryBackend>(&medium_)) {
    out = mem->initial;
    return true;
  }
  if (const auto* file = std::get_if<JsonFileBackend>(&medium_)) {
    std::error_code ec;
    if (!platform::fs::Exists(file->path, ec)) {
      if (ec) {
        return Fail(error, ErrorCode::kStorage,
                    "config stat failed: " + ec.message());
      }
      return true;
    }
    std::vector<std::uint8_t> bytes;
    if (!platform::fs::ReadFileBytes(file->path, bytes, ec)) {
      return Fail(error, ErrorCode::kStorage,
                  "config read failed: " + ec.message());
    }
    std::string text(bytes.begin(), bytes.end());
    common::SecureWipe(bytes);
    common::ScopedWipe wipe_text(text);
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
      return true;
    }
    return ParseConfigJson(text, out, error);
  }
  if (const auto* env = std::get_if<EnvironmentBackend>(&medium_)) {
    const std::string blob_var = env->prefix + kEnvBlobSuffix;
    if (const char* blob = std::getenv(blob_var.c_str())) {
      return DecodeBlob(blob, out, error);
    }
    for (const char* key : kKnownKeys) {
      const std::string var = env->prefix + ToUpper(key);
      if (const char* value = std::getenv(var.c_str())) {
        out[key] = value;
      }
    }
    return true;
  }
  const auto& blob = std::get<Base64BlobBackend>(medium_);
  if (blob.blob.empty()) {
    return true;
  }
  return DecodeBlob(blob.blob, out, error);
}

bool ConfigStore::WriteMedium(const ConfigMap& values, Error& error) const {
  const auto* file = std::get_if<JsonFileBackend>(&medium_);
  if (!file) {
    return true;
  }
  std::string text = SerializeConfigJson(values);
  common::ScopedWipe wipe_text(text);
  std::error_code ec;
  if (file->path.has_parent_path() &&
      !platform::fs::CreateDirectories(file->path.parent_path(), ec)) {
    return Fail(error, ErrorCode::kStorage,
                "config dir create failed: " + ec.message());
  }
  if (!platform::fs::AtomicWrite(
          file->path, reinterpret_cast<const std::uint8_t*>(text.data()),
          text.size(), ec)) {
    return Fail(error, ErrorCode::kStorage,
                "config write failed: " + ec.message());
  }
  return true;
}

bool ConfigStore::Load(Error& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ConfigMap fresh;
  if (!ReadMedium(fresh, error)) {
    return false;
  }
  WipeValues(values_);
  values_ = std::move(fresh);
  return true;
}

std::optional<std::string> ConfigStore::Get(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ConfigStore::Contains(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigStore::List() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(values_.size());
  for (const auto& kv : values_) {
    keys.push_back(kv.first);
  }
  return keys;
}

ConfigMap ConfigStore::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return values_;
}

bool ConfigStore::Set(const std::string& key, const std::string& value,
                      Error& error) {
  if (key.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "config key empty");
  }
  return Update(
      [&key, &value](ConfigMap& values, Error&) {
        values[key] = value;
        return true;
      },
      error);
}

bool ConfigStore::Delete(const std::string& key, Error& error) {
  return Update(
      [&key](ConfigMap& values, Error&) {
        const auto it = values.find(key);
        if (it != values.end()) {
          common::SecureWipe(it->second);
          values.erase(it);
        }
        return true;
      },
      error);
}

bool ConfigStore::Update(const Mutator& mutator, Error& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto* file = std::get_if<JsonFileBackend>(&medium_);
  if (!file) {
    return UpdateLocked(mutator, error);
  }

  std::filesystem::path lock_path = file->path;
  lock_path += ".lock";
  platform::fs::ScopedFileLock file_lock;
  const auto status = file_lock.Acquire(lock_path, file->lock_timeout_ms);
  if (status == platform::fs::FileLockStatus::kBusy) {
    return Fail(error, ErrorCode::kStorage, "config file is locked");
  }
  if (status != platform::fs::FileLockStatus::kOk) {
    return Fail(error, ErrorCode::kStorage, "config lock failed");
  }
  // Another process may have written since Load().
  ConfigMap on_disk;
  if (!ReadMedium(on_disk, error)) {
    return false;
  }
  WipeValues(values_);
  values_ = std::move(on_disk);
  return UpdateLocked(mutator, error);
}

bool ConfigStore::UpdateLocked(const Mutator& mutator, Error& error) {
  ConfigMap next = values_;
  if (!mutator(next, error)) {
    if (error.ok()) {
      error.Set(ErrorCode::kStorage, "config update rejected");
    }
    WipeValues(next);
    return false;
  }
  if (next == values_) {
    WipeValues(next);
    return true;
  }
  if (read_only()) {
    WipeValues(next);
    return Fail(error, ErrorCode::kStorage, "environment config is read-only");
  }
  if (!WriteMedium(next, error)) {
    WipeValues(next);
    return false;
  }
  WipeValues(values_);
  values_ = std::move(next);
  return true;
}

std::string ConfigStore::ExportBase64() const {
  std::string text;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    text = SerializeConfigJson(values_);
  }
  const std::string out = common::Base64Encode(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  common::SecureWipe(text);
  return out;
}

}  // namespace ksm::core
