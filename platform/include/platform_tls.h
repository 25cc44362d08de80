#ifndef KSM_PLATFORM_TLS_H
#define KSM_PLATFORM_TLS_H

#include <cstdint>
#include <string>
#include <vector>

#include "platform_net.h"

namespace ksm::platform::tls {

struct ClientVerifyConfig {
  bool verify_peer{true};
  bool verify_hostname{true};
  std::string ca_bundle_path;
};

struct ClientContext {
  void* impl{nullptr};
};

bool ClientHandshake(net::Socket sock, const std::string& host,
                     const ClientVerifyConfig& verify,
                     ClientContext& ctx,
                     std::string& error);
bool EncryptAndSend(ClientContext& ctx,
                    const std::vector<std::uint8_t>& plain);
// Appends whatever is available. out_eof is set on a clean close_notify or
// a peer that hangs up after sending everything.
bool DecryptToPlain(ClientContext& ctx,
                    std::vector<std::uint8_t>& plain_out,
                    bool& out_eof);
void Close(ClientContext& ctx);

}  // namespace ksm::platform::tls

#endif  // KSM_PLATFORM_TLS_H
