#ifndef KSM_PLATFORM_FS_H
#define KSM_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace ksm::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool ReadFileBytes(const std::filesystem::path& path,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec);
// Write to a sibling temp file, fsync, rename over the target, fsync the
// directory. The new file is created with mode 0600.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

enum class FileLockStatus {
  kOk = 0,
  kBusy = 1,
  kFailed = 2,
};

struct FileLock {
  void* impl{nullptr};
};

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        FileLock& out);
// Retries a busy lock until timeout_ms elapses.
FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        std::uint32_t timeout_ms,
                                        FileLock& out);
void ReleaseFileLock(FileLock& lock);

class ScopedFileLock {
 public:
  ScopedFileLock() = default;
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;
  ~ScopedFileLock() { ReleaseFileLock(lock_); }

  FileLockStatus Acquire(const std::filesystem::path& path,
                         std::uint32_t timeout_ms) {
    ReleaseFileLock(lock_);
    return AcquireExclusiveFileLock(path, timeout_ms, lock_);
  }

 private:
  FileLock lock_;
};

}  // namespace ksm::platform::fs

#endif  // KSM_PLATFORM_FS_H
