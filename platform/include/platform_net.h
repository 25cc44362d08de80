#ifndef KSM_PLATFORM_NET_H
#define KSM_PLATFORM_NET_H

#include <cstdint>
#include <string>

namespace ksm::platform::net {

using Socket = int;
constexpr Socket kInvalidSocket = -1;

// Applies timeout_ms to both SO_RCVTIMEO and SO_SNDTIMEO.
bool SetIoTimeouts(Socket sock, std::uint32_t timeout_ms);

bool ConnectTcp(const std::string& host, std::uint16_t port,
                std::uint32_t timeout_ms, Socket& out, std::string& error);

void CloseSocket(Socket& sock);

}  // namespace ksm::platform::net

#endif  // KSM_PLATFORM_NET_H
