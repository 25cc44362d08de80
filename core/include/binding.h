#ifndef KSM_BINDING_H
#define KSM_BINDING_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config_store.h"
#include "error.h"
#include "secure_buffer.h"
#include "server_keys.h"

namespace ksm::core {

constexpr char kDefaultHostname[] = "keepersecurity.com";

// Hostname for a region code (US, EU, AU, GOV, US_GOV, JP, CA), any case.
std::optional<std::string> RegionHostname(std::string_view region);

struct OneTimeToken {
  std::string hostname;
  std::string secret;
};

// REGION:SECRET, HOST:SECRET or a bare SECRET (US).
bool ParseOneTimeToken(const std::string& token, OneTimeToken& out,
                       Error& error);

// Base64 HMAC-SHA512(client_key, "KEEPER_SECRETS_MANAGER_CLIENT_ID").
bool ComputeClientId(const std::vector<std::uint8_t>& client_key,
                     std::string& out, Error& error);

enum class BindingState : std::uint8_t { kUnbound = 0, kBinding, kBound };

const char* BindingStateName(BindingState state);
BindingState BindingStateOf(const ConfigMap& values);

struct InitializeOptions {
  std::optional<std::string> hostname;
  std::optional<std::uint32_t> server_public_key_id;
  bool force{false};
};

// Redeeming the token that is already stored is a no-op; a different token
// on a bound store needs force.
bool InitializeStorage(ConfigStore& store, const std::string& token,
                       const ServerKeyTable& table,
                       const InitializeOptions& options, Error& error);

// Unwraps the app key with the stored client key and moves the store to
// Bound in one update. Nothing is written when the unwrap fails. A store
// that another caller already bound for the same client_id counts as
// success.
bool CompleteBinding(ConfigStore& store, const std::string& client_id,
                     const std::vector<std::uint8_t>& encrypted_app_key,
                     const std::vector<std::uint8_t>& app_owner_public_key,
                     Error& error);

bool ResetBinding(ConfigStore& store, Error& error);

struct DeviceCredentials {
  BindingState state{BindingState::kUnbound};
  std::string client_id;
  std::string hostname;
  std::optional<std::uint32_t> server_public_key_id;
  common::SecureBuffer private_key;   // PKCS#8
  common::SecureBuffer client_key;    // binding only
  common::SecureBuffer app_key;       // bound only
  std::vector<std::uint8_t> app_owner_public_key;
};

// Fails with kStorage when the store is unbound or a value is malformed.
bool LoadDeviceCredentials(const ConfigStore& store, DeviceCredentials& out,
                           Error& error);

}  // namespace ksm::core

#endif  // KSM_BINDING_H
