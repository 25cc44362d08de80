#include "platform_fs.h"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "platform_time.h"

namespace ksm::platform::fs {

namespace {

constexpr std::uint32_t kLockPollMs = 20;
constexpr int kTempAttempts = 16;
constexpr mode_t kPrivateMode = 0600;

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

// Owns one descriptor; closes it unless Close() already ran.
class Descriptor {
 public:
  explicit Descriptor(int fd) : fd_(fd) {}
  Descriptor(const Descriptor&) = delete;
  Descriptor& operator=(const Descriptor&) = delete;
  ~Descriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  bool valid() const { return fd_ >= 0; }
  int get() const { return fd_; }

  bool Close(std::error_code& ec) {
    const int fd = fd_;
    fd_ = -1;
    if (fd >= 0 && ::close(fd) != 0) {
      ec = LastError();
      return false;
    }
    return true;
  }

  int Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

int OpenRetrying(const char* path, int flags, mode_t mode) {
  int fd;
  do {
    fd = ::open(path, flags | O_CLOEXEC, mode);
  } while (fd < 0 && errno == EINTR);
  return fd;
}

bool WriteFully(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  while (len > 0) {
    const ssize_t rc = ::write(fd, data, len);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      ec = rc < 0 ? LastError() : std::make_error_code(std::errc::io_error);
      return false;
    }
    data += rc;
    len -= static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path SiblingTempName(const std::filesystem::path& target,
                                      int attempt) {
  std::string name = target.filename().string();
  if (name.empty()) {
    name = "ksm";
  }
  name = "." + name + "." + std::to_string(::getpid()) + "-" +
         std::to_string(attempt) + ".part";
  return target.has_parent_path() ? target.parent_path() / name
                                  : std::filesystem::path(name);
}

void SyncParentDirectory(const std::filesystem::path& target) {
  const std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path()
                               : std::filesystem::path(".");
  Descriptor dfd(OpenRetrying(dir.c_str(), O_RDONLY | O_DIRECTORY, 0));
  if (dfd.valid()) {
    ::fsync(dfd.get());
  }
}

}  // namespace

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool ReadFileBytes(const std::filesystem::path& path,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec) {
  out.clear();
  ec.clear();
  Descriptor fd(OpenRetrying(path.c_str(), O_RDONLY, 0));
  if (!fd.valid()) {
    ec = LastError();
    return false;
  }
  struct stat st {};
  if (::fstat(fd.get(), &st) == 0 && st.st_size > 0) {
    out.reserve(static_cast<std::size_t>(st.st_size));
  }
  std::uint8_t chunk[4096];
  for (;;) {
    const ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
    if (n == 0) {
      return true;
    }
    if (n > 0) {
      out.insert(out.end(), chunk, chunk + n);
    } else if (errno != EINTR) {
      ec = LastError();
      out.clear();
      return false;
    }
  }
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && data == nullptr)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  std::filesystem::path tmp;
  int raw = -1;
  for (int attempt = 0; attempt < kTempAttempts && raw < 0; ++attempt) {
    tmp = SiblingTempName(path, attempt);
    raw = OpenRetrying(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL,
                       kPrivateMode);
    if (raw < 0 && errno != EEXIST) {
      ec = LastError();
      return false;
    }
  }
  if (raw < 0) {
    ec = std::make_error_code(std::errc::file_exists);
    return false;
  }

  Descriptor fd(raw);
  bool ok = WriteFully(fd.get(), data, len, ec);
  if (ok && ::fsync(fd.get()) != 0) {
    ec = LastError();
    ok = false;
  }
  ok = ok && fd.Close(ec);
  if (ok && ::rename(tmp.c_str(), path.c_str()) != 0) {
    ec = LastError();
    ok = false;
  }
  if (!ok) {
    std::error_code cleanup;
    std::filesystem::remove(tmp, cleanup);
    return false;
  }
  SyncParentDirectory(path);
  return true;
}

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        FileLock& out) {
  out.impl = nullptr;
  if (path.empty()) {
    return FileLockStatus::kFailed;
  }
  Descriptor fd(OpenRetrying(path.c_str(), O_RDWR | O_CREAT, kPrivateMode));
  if (!fd.valid()) {
    return FileLockStatus::kFailed;
  }
  if (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
    return errno == EWOULDBLOCK ? FileLockStatus::kBusy
                                : FileLockStatus::kFailed;
  }
  out.impl = new int(fd.Release());
  return FileLockStatus::kOk;
}

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        std::uint32_t timeout_ms,
                                        FileLock& out) {
  const std::uint64_t deadline = NowSteadyMs() + timeout_ms;
  FileLockStatus status = AcquireExclusiveFileLock(path, out);
  while (status == FileLockStatus::kBusy && NowSteadyMs() < deadline) {
    SleepMs(kLockPollMs);
    status = AcquireExclusiveFileLock(path, out);
  }
  return status;
}

void ReleaseFileLock(FileLock& lock) {
  auto* fd = static_cast<int*>(lock.impl);
  lock.impl = nullptr;
  if (fd == nullptr) {
    return;
  }
  ::flock(*fd, LOCK_UN);
  ::close(*fd);
  delete fd;
}

}  // namespace ksm::platform::fs
