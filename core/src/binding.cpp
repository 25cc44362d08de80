#include "binding.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "constant_time.h"
#include "crypto.h"
#include "encoding_utils.h"
#include "platform_log.h"

namespace ksm::core {

namespace {

constexpr char kTag[] = "binding";
constexpr char kClientIdLabel[] = "KEEPER_SECRETS_MANAGER_CLIENT_ID";

struct Region {
  const char* code;
  const char* hostname;
};

constexpr Region kRegions[] = {
    {"US", "keepersecurity.com"},
    {"EU", "keepersecurity.eu"},
    {"AU", "keepersecurity.com.au"},
    {"GOV", "govcloud.keepersecurity.us"},
    {"US_GOV", "govcloud.keepersecurity.us"},
    {"JP", "keepersecurity.jp"},
    {"CA", "keepersecurity.ca"},
};

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool DecodeSecret(const std::string& key, const std::string& value,
                  common::SecureBuffer& out, Error& error) {
  std::vector<std::uint8_t> raw;
  if (!common::Base64Decode(value, raw) || raw.empty()) {
    common::SecureWipe(raw);
    return Fail(error, ErrorCode::kStorage, key + " is not valid base64");
  }
  out = common::SecureBuffer(std::move(raw));
  return true;
}

std::optional<std::string> Lookup(const ConfigMap& values,
                                  const std::string& key) {
  const auto it = values.find(key);
  if (it == values.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

std::optional<std::string> RegionHostname(std::string_view region) {
  std::string upper(region);
  for (auto& ch : upper) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  for (const auto& r : kRegions) {
    if (upper == r.code) {
      return std::string(r.hostname);
    }
  }
  return std::nullopt;
}

bool ParseOneTimeToken(const std::string& token, OneTimeToken& out,
                       Error& error) {
  out = OneTimeToken{};
  const std::string t = Trim(token);
  const auto colon = t.find(':');
  if (colon == std::string::npos) {
    out.hostname = kDefaultHostname;
    out.secret = t;
  } else {
    const std::string prefix = Trim(t.substr(0, colon));
    out.secret = Trim(t.substr(colon + 1));
    if (prefix.empty()) {
      return Fail(error, ErrorCode::kInvalidArgument,
                  "one-time token region is empty");
    }
    auto host = RegionHostname(prefix);
    out.hostname = host.has_value() ? std::move(*host) : prefix;
  }
  if (out.secret.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "one-time token secret is empty");
  }
  return true;
}

bool ComputeClientId(const std::vector<std::uint8_t>& client_key,
                     std::string& out, Error& error) {
  crypto::Sha512Digest mac;
  const auto* label = reinterpret_cast<const std::uint8_t*>(kClientIdLabel);
  if (!crypto::HmacSha512(client_key.data(), client_key.size(), label,
                          sizeof(kClientIdLabel) - 1, mac)) {
    return Fail(error, ErrorCode::kCrypto, "client id hmac failed");
  }
  out = common::Base64Encode(mac.bytes.data(), mac.bytes.size());
  return true;
}

const char* BindingStateName(BindingState state) {
  switch (state) {
    case BindingState::kUnbound:
      return "unbound";
    case BindingState::kBinding:
      return "binding";
    case BindingState::kBound:
      return "bound";
  }
  return "unknown";
}

BindingState BindingStateOf(const ConfigMap& values) {
  if (!Lookup(values, config_keys::kClientId)) {
    return BindingState::kUnbound;
  }
  const auto bound_flag = Lookup(values, config_keys::kBoundFlag);
  // Configs exported by other tools carry appKey without a flag.
  if (Lookup(values, config_keys::kAppKey) &&
      bound_flag.value_or("true") == "true") {
    return BindingState::kBound;
  }
  if (Lookup(values, config_keys::kClientKey)) {
    return BindingState::kBinding;
  }
  return BindingState::kUnbound;
}

bool InitializeStorage(ConfigStore& store, const std::string& token,
                       const ServerKeyTable& table,
                       const InitializeOptions& options, Error& error) {
  OneTimeToken parsed;
  if (!ParseOneTimeToken(token, parsed, error)) {
    return false;
  }
  std::vector<std::uint8_t> client_key;
  common::ScopedWipe wipe_client_key(client_key);
  if (!common::Base64Decode(parsed.secret, client_key) || client_key.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "one-time token secret is not base64");
  }
  std::string client_id;
  if (!ComputeClientId(client_key, client_id, error)) {
    return false;
  }
  std::string hostname = options.hostname.value_or(parsed.hostname);
  const std::uint32_t key_id =
      options.server_public_key_id.value_or(table.HighestId());
  if (!table.Contains(key_id)) {
    return Fail(error, ErrorCode::kUnknownServerKey,
                "server public key " + std::to_string(key_id) +
                    " is not pinned");
  }

  bool unchanged = false;
  const bool ok = store.Update(
      [&](ConfigMap& values, Error& err) {
        const BindingState state = BindingStateOf(values);
        const auto existing = Lookup(values, config_keys::kClientId);
        if (existing && common::ConstantTimeEqual(*existing, client_id)) {
          unchanged = true;
          return true;
        }
        if (state == BindingState::kBound && !options.force) {
          return Fail(err, ErrorCode::kAlreadyBound,
                      "storage is bound to another client; use force");
        }

        crypto::EcKeyPair pair;
        if (!crypto::GenerateEcKeyPair(pair, err)) {
          return false;
        }
        for (const char* key : {config_keys::kAppKey,
                                config_keys::kAppOwnerPublicKey}) {
          const auto it = values.find(key);
          if (it != values.end()) {
            common::SecureWipe(it->second);
            values.erase(it);
          }
        }
        values[config_keys::kHostname] = hostname;
        values[config_keys::kClientKey] = common::Base64UrlEncode(client_key);
        values[config_keys::kClientId] = client_id;
        values[config_keys::kPrivateKey] =
            common::Base64Encode(pair.private_der.bytes());
        values[config_keys::kServerPublicKeyId] = std::to_string(key_id);
        values[config_keys::kBoundFlag] = "false";
        return true;
      },
      error);
  if (!ok) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, kTag,
                     unchanged ? "token already redeemed on this storage"
                               : "storage initialized",
                     {{"hostname", hostname},
                      {"key_id", std::to_string(key_id)}});
  return true;
}

bool CompleteBinding(ConfigStore& store, const std::string& client_id,
                     const std::vector<std::uint8_t>& encrypted_app_key,
                     const std::vector<std::uint8_t>& app_owner_public_key,
                     Error& error) {
  const auto bound_for_caller = [&client_id](const ConfigMap& values) {
    const auto stored_id = Lookup(values, config_keys::kClientId);
    return BindingStateOf(values) == BindingState::kBound && stored_id &&
           common::ConstantTimeEqual(*stored_id, client_id);
  };

  const auto client_key_text = store.Get(config_keys::kClientKey);
  if (!client_key_text) {
    ConfigMap values = store.Snapshot();
    const bool done = bound_for_caller(values);
    for (auto& kv : values) common::SecureWipe(kv.second);
    if (done) {
      platform::log::Log(platform::log::Level::kDebug, kTag,
                         "binding already completed");
      return true;
    }
    return Fail(error, ErrorCode::kKeyUnavailable,
                "client key missing; storage is not binding");
  }
  common::SecureBuffer client_key;
  if (!DecodeSecret(config_keys::kClientKey, *client_key_text, client_key,
                    error)) {
    return false;
  }
  std::vector<std::uint8_t> app_key;
  common::ScopedWipe wipe_app_key(app_key);
  if (!crypto::AesGcmDecrypt(encrypted_app_key, client_key, app_key, error)) {
    platform::log::Log(platform::log::Level::kError, kTag,
                       "app key unwrap failed");
    return false;
  }
  if (app_key.size() != crypto::kAesKeyBytes) {
    return Fail(error, ErrorCode::kCrypto, "app key has wrong length");
  }
  std::string app_key_text = common::Base64Encode(app_key);
  common::ScopedWipe wipe_app_key_text(app_key_text);

  bool raced = false;
  const bool ok = store.Update(
      [&](ConfigMap& values, Error& err) {
        const auto current = Lookup(values, config_keys::kClientKey);
        if (!current || !common::ConstantTimeEqual(*current, *client_key_text)) {
          // A concurrent completion for this client got there first.
          const auto stored_app_key = Lookup(values, config_keys::kAppKey);
          if (bound_for_caller(values) && stored_app_key &&
              common::ConstantTimeEqual(*stored_app_key, app_key_text)) {
            raced = true;
            return true;
          }
          return Fail(err, ErrorCode::kStorage,
                      "client key changed during binding");
        }
        values[config_keys::kAppKey] = app_key_text;
        if (!app_owner_public_key.empty()) {
          values[config_keys::kAppOwnerPublicKey] =
              common::Base64Encode(app_owner_public_key);
        }
        values[config_keys::kBoundFlag] = "true";
        auto it = values.find(config_keys::kClientKey);
        common::SecureWipe(it->second);
        values.erase(it);
        return true;
      },
      error);
  if (ok) {
    platform::log::Log(platform::log::Level::kInfo, kTag,
                       raced ? "binding completed by a concurrent call"
                             : "binding complete");
  }
  return ok;
}

bool ResetBinding(ConfigStore& store, Error& error) {
  return store.Update(
      [](ConfigMap& values, Error&) {
        for (const char* key :
             {config_keys::kClientId, config_keys::kClientKey,
              config_keys::kAppKey, config_keys::kAppOwnerPublicKey,
              config_keys::kPrivateKey, config_keys::kBoundFlag}) {
          const auto it = values.find(key);
          if (it != values.end()) {
            common::SecureWipe(it->second);
            values.erase(it);
          }
        }
        return true;
      },
      error);
}

bool LoadDeviceCredentials(const ConfigStore& store, DeviceCredentials& out,
                           Error& error) {
  out = DeviceCredentials{};
  ConfigMap values = store.Snapshot();
  struct WipeOnExit {
    ConfigMap& values;
    ~WipeOnExit() {
      for (auto& kv : values) common::SecureWipe(kv.second);
    }
  } wipe_values{values};

  out.state = BindingStateOf(values);
  if (out.state == BindingState::kUnbound) {
    return Fail(error, ErrorCode::kStorage,
                "storage is not initialized; a one-time token is required");
  }
  out.client_id = values[config_keys::kClientId];
  out.hostname = Lookup(values, config_keys::kHostname).value_or(kDefaultHostname);

  const auto private_key = Lookup(values, config_keys::kPrivateKey);
  if (!private_key) {
    return Fail(error, ErrorCode::kStorage, "privateKey missing");
  }
  if (!DecodeSecret(config_keys::kPrivateKey, *private_key, out.private_key,
                    error)) {
    return false;
  }
  if (const auto id = Lookup(values, config_keys::kServerPublicKeyId)) {
    if (id->empty() || id->size() > 10 ||
        !std::all_of(id->begin(), id->end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
      return Fail(error, ErrorCode::kStorage, "serverPublicKeyId malformed");
    }
    const unsigned long long v = std::stoull(*id);
    if (v > 0xFFFFFFFFull) {
      return Fail(error, ErrorCode::kStorage, "serverPublicKeyId malformed");
    }
    out.server_public_key_id = static_cast<std::uint32_t>(v);
  }

  if (out.state == BindingState::kBinding) {
    return DecodeSecret(config_keys::kClientKey,
                        values[config_keys::kClientKey], out.client_key,
                        error);
  }
  if (!DecodeSecret(config_keys::kAppKey, values[config_keys::kAppKey],
                    out.app_key, error)) {
    return false;
  }
  if (const auto owner = Lookup(values, config_keys::kAppOwnerPublicKey)) {
    if (!common::Base64Decode(*owner, out.app_owner_public_key)) {
      return Fail(error, ErrorCode::kStorage, "appOwnerPublicKey malformed");
    }
  }
  return true;
}

}  // namespace ksm::core
