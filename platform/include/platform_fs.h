#ifndef ICA_PLATFORM_FS_H
#define ICA_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace ica::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
// Creates |path| and any missing parents with owner-only permissions.
bool CreatePrivateDirectories(const std::filesystem::path& path,
                              std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);
bool ReadFileText(const std::filesystem::path& path, std::size_t max_bytes,
                  std::string& out, std::error_code& ec);
// Writes to a sibling temp file, fsyncs it and renames it over |path|.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);
bool AtomicWriteText(const std::filesystem::path& path,
                     const std::string& text,
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
void ReleaseFileLock(FileLock& lock);

class ScopedFileLock {
 public:
  explicit ScopedFileLock(const std::filesystem::path& path)
      : status_(AcquireExclusiveFileLock(path, lock_)) {}
  ~ScopedFileLock() { ReleaseFileLock(lock_); }

  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  FileLockStatus status() const { return status_; }

 private:
  FileLock lock_;
  FileLockStatus status_;
};

}  // namespace ica::platform::fs

#endif  // ICA_PLATFORM_FS_H
