#include <cassert>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "platform_fs.h"
#include "test_support.h"

namespace fs = ksm::platform::fs;

int main() {
  const auto dir = ksm::test::MakeTempDir("ksm_fs_lock_test");
  const auto lock_path = dir / "ksm-config.json.lock";

  fs::FileLock lock1;
  fs::FileLock lock2;

  const auto s1 = fs::AcquireExclusiveFileLock(lock_path, lock1);
  assert(s1 == fs::FileLockStatus::kOk);

  const auto s2 = fs::AcquireExclusiveFileLock(lock_path, lock2);
  assert(s2 == fs::FileLockStatus::kBusy);

  // The timed variant gives up once the holder keeps the lock.
  const auto s3 = fs::AcquireExclusiveFileLock(lock_path, 50, lock2);
  assert(s3 == fs::FileLockStatus::kBusy);

  fs::ReleaseFileLock(lock1);

  const auto s4 = fs::AcquireExclusiveFileLock(lock_path, 50, lock2);
  assert(s4 == fs::FileLockStatus::kOk);
  fs::ReleaseFileLock(lock2);

  {
    fs::ScopedFileLock scoped;
    assert(scoped.Acquire(lock_path, 50) == fs::FileLockStatus::kOk);
    fs::FileLock contender;
    assert(fs::AcquireExclusiveFileLock(lock_path, contender) ==
           fs::FileLockStatus::kBusy);
  }
  fs::FileLock after;
  assert(fs::AcquireExclusiveFileLock(lock_path, after) ==
         fs::FileLockStatus::kOk);
  fs::ReleaseFileLock(after);

  const auto target = dir / "nested" / "blob.bin";
  std::error_code ec;
  assert(fs::CreateDirectories(target.parent_path(), ec));
  const std::string payload = "{\"clientId\":\"x\"}";
  assert(fs::AtomicWrite(target,
                         reinterpret_cast<const std::uint8_t*>(payload.data()),
                         payload.size(), ec));
  std::vector<std::uint8_t> back;
  assert(fs::ReadFileBytes(target, back, ec));
  assert(std::string(back.begin(), back.end()) == payload);
  const auto perms = std::filesystem::status(target).permissions();
  assert((perms & (std::filesystem::perms::group_all |
                   std::filesystem::perms::others_all)) ==
         std::filesystem::perms::none);
  return 0;
}
