#include <cassert>
#include <cstdint>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "binding.h"
#include "config_store.h"
#include "crypto.h"
#include "encoding_utils.h"
#include "server_keys.h"
#include "test_support.h"

using namespace ksm::core;
namespace common = ksm::common;

namespace {

std::string TokenFor(const std::vector<std::uint8_t>& client_key,
                     const std::string& prefix = "US") {
  return prefix + ":" + common::Base64UrlEncode(client_key);
}

std::string ExpectedClientId(const std::vector<std::uint8_t>& client_key) {
  const std::string label = "KEEPER_SECRETS_MANAGER_CLIENT_ID";
  crypto::Sha512Digest mac;
  assert(crypto::HmacSha512(
      client_key.data(), client_key.size(),
      reinterpret_cast<const std::uint8_t*>(label.data()), label.size(), mac));
  return common::Base64Encode(mac.bytes.data(), mac.bytes.size());
}

void TestTokens() {
  assert(RegionHostname("eu") == std::string("keepersecurity.eu"));
  assert(RegionHostname("US_GOV") == std::string("govcloud.keepersecurity.us"));
  assert(RegionHostname("JP") == std::string("keepersecurity.jp"));
  assert(!RegionHostname("MARS").has_value());

  OneTimeToken token;
  Error error;
  assert(ParseOneTimeToken("AU:c2VjcmV0", token, error));
  assert(token.hostname == "keepersecurity.com.au");
  assert(token.secret == "c2VjcmV0");

  assert(ParseOneTimeToken("  c2VjcmV0 ", token, error));
  assert(token.hostname == kDefaultHostname);
  assert(token.secret == "c2VjcmV0");

  assert(ParseOneTimeToken("ksm.example.net:c2VjcmV0", token, error));
  assert(token.hostname == "ksm.example.net");

  assert(!ParseOneTimeToken(":c2VjcmV0", token, error));
  assert(error.code == ErrorCode::kInvalidArgument);
  error.Clear();
  assert(!ParseOneTimeToken("EU:", token, error));
  assert(error.code == ErrorCode::kInvalidArgument);
}

void TestStates() {
  assert(BindingStateOf({}) == BindingState::kUnbound);
  assert(BindingStateOf({{config_keys::kClientId, "id"},
                         {config_keys::kClientKey, "ck"}}) ==
         BindingState::kBinding);
  assert(BindingStateOf({{config_keys::kClientId, "id"},
                         {config_keys::kAppKey, "ak"},
                         {config_keys::kBoundFlag, "true"}}) ==
         BindingState::kBound);
  // Exported configs carry no flag.
  assert(BindingStateOf({{config_keys::kClientId, "id"},
                         {config_keys::kAppKey, "ak"}}) ==
         BindingState::kBound);
  assert(BindingStateOf({{config_keys::kClientId, "id"}}) ==
         BindingState::kUnbound);
  assert(std::string(BindingStateName(BindingState::kBinding)) == "binding");
}

void TestInitializeAndComplete() {
  ksm::test::FakeBackend backend;
  const ServerKeyTable& table = backend.table();
  const auto client_key = ksm::test::RandomKey();
  const auto app_key = ksm::test::RandomKey();

  ConfigStore store(MemoryBackend{});
  Error error;
  assert(InitializeStorage(store, TokenFor(client_key, "EU"), table, {},
                           error));
  assert(BindingStateOf(store.Snapshot()) == BindingState::kBinding);
  assert(store.Get(config_keys::kHostname) == std::string("keepersecurity.eu"));
  assert(store.Get(config_keys::kClientId) == ExpectedClientId(client_key));
  assert(store.Get(config_keys::kServerPublicKeyId) ==
         std::to_string(table.HighestId()));
  assert(store.Get(config_keys::kBoundFlag) == std::string("false"));
  const auto private_key = store.Get(config_keys::kPrivateKey);
  assert(private_key.has_value());

  // Same token again: nothing regenerated.
  assert(InitializeStorage(store, TokenFor(client_key, "EU"), table, {},
                           error));
  assert(store.Get(config_keys::kPrivateKey) == private_key);

  DeviceCredentials creds;
  assert(LoadDeviceCredentials(store, creds, error));
  assert(creds.state == BindingState::kBinding);
  assert(creds.client_key.bytes() == client_key);
  assert(creds.server_public_key_id == table.HighestId());

  // A wrapped key that does not open under the client key writes nothing.
  std::vector<std::uint8_t> garbage(60, 0x5A);
  const ConfigMap before = store.Snapshot();
  const std::string client_id = ExpectedClientId(client_key);
  assert(!CompleteBinding(store, client_id, garbage, {}, error));
  assert(error.code == ErrorCode::kAuthenticationFailed);
  assert(store.Snapshot() == before);

  std::vector<std::uint8_t> wrapped;
  error.Clear();
  assert(crypto::AesGcmEncrypt(app_key, client_key.data(), client_key.size(),
                               wrapped, error));
  const std::vector<std::uint8_t> owner(65, 0x04);
  assert(CompleteBinding(store, client_id, wrapped, owner, error));
  assert(BindingStateOf(store.Snapshot()) == BindingState::kBound);
  assert(!store.Contains(config_keys::kClientKey));
  assert(store.Get(config_keys::kBoundFlag) == std::string("true"));

  assert(LoadDeviceCredentials(store, creds, error));
  assert(creds.state == BindingState::kBound);
  assert(creds.app_key.bytes() == app_key);
  assert(creds.app_owner_public_key == owner);
  assert(creds.client_id == ExpectedClientId(client_key));

  // A late completion for the same client finds the work done.
  const ConfigMap bound = store.Snapshot();
  assert(CompleteBinding(store, client_id, wrapped, owner, error));
  assert(store.Snapshot() == bound);
  // For any other client there is no client key to work with.
  assert(!CompleteBinding(store, "someone-else", wrapped, owner, error));
  assert(error.code == ErrorCode::kKeyUnavailable);

  // A different token on bound storage needs force.
  const auto other_key = ksm::test::RandomKey();
  error.Clear();
  assert(!InitializeStorage(store, TokenFor(other_key), table, {}, error));
  assert(error.code == ErrorCode::kAlreadyBound);
  assert(store.Get(config_keys::kClientId) == ExpectedClientId(client_key));

  InitializeOptions force;
  force.force = true;
  force.hostname = "ksm.example.net";
  error.Clear();
  assert(InitializeStorage(store, TokenFor(other_key), table, force, error));
  assert(BindingStateOf(store.Snapshot()) == BindingState::kBinding);
  assert(!store.Contains(config_keys::kAppKey));
  assert(store.Get(config_keys::kHostname) == std::string("ksm.example.net"));

  assert(ResetBinding(store, error));
  assert(BindingStateOf(store.Snapshot()) == BindingState::kUnbound);
  assert(!LoadDeviceCredentials(store, creds, error));
  assert(error.code == ErrorCode::kStorage);
}

void TestRejectedTokens() {
  ksm::test::FakeBackend backend;
  ConfigStore store(MemoryBackend{});
  Error error;
  assert(!InitializeStorage(store, "US:%%%not-base64%%%", backend.table(), {},
                            error));
  assert(error.code == ErrorCode::kInvalidArgument);

  InitializeOptions unknown_key;
  unknown_key.server_public_key_id = 99;
  error.Clear();
  assert(!InitializeStorage(store, TokenFor(ksm::test::RandomKey()),
                            backend.table(), unknown_key, error));
  assert(error.code == ErrorCode::kUnknownServerKey);
  assert(store.List().empty());
}

}  // namespace

// Several first fetches can each receive the app key; every one of them
// has to come back successful and the store must end up bound once.
void TestConcurrentCompletion() {
  ksm::test::FakeBackend backend;
  const auto client_key = ksm::test::RandomKey();
  const auto app_key = ksm::test::RandomKey();
  ConfigStore store(MemoryBackend{});
  Error error;
  assert(InitializeStorage(store, TokenFor(client_key), backend.table(), {},
                           error));
  std::vector<std::uint8_t> wrapped;
  assert(crypto::AesGcmEncrypt(app_key, client_key.data(), client_key.size(),
                               wrapped, error));
  const std::string client_id = ExpectedClientId(client_key);

  std::atomic<int> succeeded{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 8; ++i) {
    callers.emplace_back([&] {
      Error local;
      if (CompleteBinding(store, client_id, wrapped, {}, local)) {
        succeeded.fetch_add(1);
      }
    });
  }
  for (auto& t : callers) {
    t.join();
  }
  assert(succeeded.load() == 8);

  DeviceCredentials creds;
  assert(LoadDeviceCredentials(store, creds, error));
  assert(creds.state == BindingState::kBound);
  assert(creds.app_key.bytes() == app_key);
  assert(!store.Contains(config_keys::kClientKey));
}

int main() {
  TestTokens();
  TestStates();
  TestInitializeAndComplete();
  TestRejectedTokens();
  TestConcurrentCompletion();
  return 0;
}
