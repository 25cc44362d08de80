#include "platform_net.h"

#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ksm::platform::net {

namespace {

bool SetBlocking(Socket sock, bool blocking) {
  const int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int next = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(sock, F_SETFL, next) == 0;
}

// Non-blocking connect bounded by timeout_ms; the socket is left blocking.
bool ConnectWithTimeout(Socket sock, const sockaddr* addr, socklen_t len,
                        std::uint32_t timeout_ms) {
  if (timeout_ms == 0) {
    return ::connect(sock, addr, len) == 0;
  }
  if (!SetBlocking(sock, false)) {
    return false;
  }
  int rc = ::connect(sock, addr, len);
  if (rc != 0 && errno != EINPROGRESS) {
    return false;
  }
  if (rc != 0) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    do {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (rc < 0 && errno == EINTR);
    if (rc <= 0) {
      return false;
    }
    int so_error = 0;
    socklen_t so_len = static_cast<socklen_t>(sizeof(so_error));
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 ||
        so_error != 0) {
      return false;
    }
  }
  return SetBlocking(sock, true);
}

}  // namespace

bool SetIoTimeouts(Socket sock, std::uint32_t timeout_ms) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout_ms / 1000u);
  tv.tv_usec = static_cast<long>((timeout_ms % 1000u) * 1000u);
  const auto len = static_cast<socklen_t>(sizeof(tv));
  return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, len) == 0 &&
         setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, len) == 0;
}


bool ConnectTcp(const std::string& host, std::uint16_t port,
                std::uint32_t timeout_ms, Socket& out, std::string& error) {
  out = kInvalidSocket;
  error.clear();
  if (host.empty() || port == 0) {
    error = "invalid endpoint";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0) {
    error = "dns resolve failed: " + host;
    return false;
  }

  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    Socket sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock < 0) {
      continue;
    }
    if (ConnectWithTimeout(sock, rp->ai_addr, rp->ai_addrlen, timeout_ms)) {
      const int one = 1;
      (void)setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one,
                       static_cast<socklen_t>(sizeof(one)));
      out = sock;
      break;
    }
    ::close(sock);
  }
  freeaddrinfo(result);

  if (out < 0) {
    error = "connect failed: " + host;
    return false;
  }
  if (timeout_ms > 0 && !SetIoTimeouts(out, timeout_ms)) {
    error = "socket timeout setup failed: " + host;
    CloseSocket(out);
    return false;
  }
  return true;
}

void CloseSocket(Socket& sock) {
  if (sock >= 0) {
    ::close(sock);
    sock = kInvalidSocket;
  }
}

}  // namespace ksm::platform::net
