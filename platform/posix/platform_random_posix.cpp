#include "platform_random.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace ksm::platform {

namespace {

// Loops a short-reading source until len bytes arrive. A zero or a
// non-EINTR failure stops the loop.
template <typename Source>
bool FillFrom(Source&& source, std::uint8_t* out, std::size_t len) {
  std::size_t filled = 0;
  while (filled < len) {
    const ssize_t got = source(out + filled, len - filled);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      return false;
    }
    filled += static_cast<std::size_t>(got);
  }
  return true;
}

bool FromUrandom(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const bool ok = FillFrom(
      [fd](std::uint8_t* p, std::size_t n) { return ::read(fd, p, n); }, out,
      len);
  ::close(fd);
  return ok;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (out == nullptr || len == 0) {
    return false;
  }
#if defined(__linux__)
  if (FillFrom([](std::uint8_t* p, std::size_t n) {
        return ::getrandom(p, n, 0);
      },
               out, len)) {
    return true;
  }
#endif
  return FromUrandom(out, len);
}

bool RandomBytes(std::size_t len, std::vector<std::uint8_t>& out) {
  out.assign(len, 0);
  if (!RandomBytes(out.data(), out.size())) {
    out.clear();
    return false;
  }
  return true;
}

}  // namespace ksm::platform
