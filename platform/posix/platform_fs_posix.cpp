#include "platform_fs.h"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {
struct FileLockImpl {
  int fd{-1};
};

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const ssize_t rc = ::write(fd, data + offset, len - offset);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path BuildTempPath(const std::filesystem::path& target,
                                    int attempt) {
  std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path{};
  std::string base = target.filename().string();
  if (base.empty()) {
    base = "tmp";
  }
  const int pid = static_cast<int>(::getpid());
  std::string name = "." + base + ".tmp." + std::to_string(pid) + "." +
                     std::to_string(attempt);
  return dir.empty() ? std::filesystem::path{name} : (dir / name);
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ignore_ec;
  std::filesystem::remove(path, ignore_ec);
}
}  // namespace

namespace ica::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CreatePrivateDirectories(const std::filesystem::path& path,
                              std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (std::filesystem::is_directory(path, ec)) {
    return true;
  }
  ec.clear();
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return false;
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  return !ec;
}

bool Remove(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::remove(path, ec);
}

bool ReadFileText(const std::filesystem::path& path, std::size_t max_bytes,
                  std::string& out, std::error_code& ec) {
  out.clear();
  ec.clear();
  const std::uint64_t size = FileSize(path, ec);
  if (ec) {
    return false;
  }
  if (size > max_bytes) {
    ec = std::make_error_code(std::errc::file_too_large);
    return false;
  }
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  if (f.bad()) {
    out.clear();
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (len > 0 && !data) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(path, attempt);
    const int fd =
        ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      SetErrno(ec);
      return false;
    }

    if (len > 0 && !WriteAllFd(fd, data, len, ec)) {
      ::close(fd);
      RemoveQuietly(tmp);
      return false;
    }
    if (::fsync(fd) != 0) {
      SetErrno(ec);
      ::close(fd);
      RemoveQuietly(tmp);
      return false;
    }
    if (::close(fd) != 0) {
      SetErrno(ec);
      RemoveQuietly(tmp);
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      SetErrno(ec);
      RemoveQuietly(tmp);
      return false;
    }

    std::filesystem::path dir =
        path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    const int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) {
      (void)::fsync(dfd);
      (void)::close(dfd);
    }
    return true;
  }

  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

bool AtomicWriteText(const std::filesystem::path& path,
                     const std::string& text,
                     std::error_code& ec) {
  return AtomicWrite(path, reinterpret_cast<const std::uint8_t*>(text.data()),
                     text.size(), ec);
}

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        FileLock& out) {
  out.impl = nullptr;
  if (path.empty()) {
    return FileLockStatus::kFailed;
  }
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0600);
  if (fd < 0) {
    return FileLockStatus::kFailed;
  }
  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    ::close(fd);
    return FileLockStatus::kBusy;
  }
  auto* impl = new FileLockImpl();
  impl->fd = fd;
  out.impl = impl;
  return FileLockStatus::kOk;
}

void ReleaseFileLock(FileLock& lock) {
  if (!lock.impl) {
    return;
  }
  auto* impl = static_cast<FileLockImpl*>(lock.impl);
  if (impl->fd >= 0) {
    flock(impl->fd, LOCK_UN);
    ::close(impl->fd);
    impl->fd = -1;
  }
  delete impl;
  lock.impl = nullptr;
}

}  // namespace ica::platform::fs
