#include "statik/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>

#include "statik/log.hpp"
#include "statik/timedef.hpp"

namespace statik {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    const auto err = errno;
    log::error("open '{}' failed: {}", path, std::strerror(err));
    errno = err;
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    const auto err = errno;
    log::error("fstat on fd # {} failed: {}", _fd.fd(), std::strerror(err));
    _fd.close();
    errno = err;
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
  log::debug("File fd # {} opened for '{}' ({} bytes)", _fd.fd(), path, _fileSize);
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead != -1) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread on fd # {} at offset {} failed: {}", _fd.fd(), offset, std::strerror(errno));
      return kError;
    }
  }
}

int FileStat(const std::string& path, FileStatus& out) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return errno;
  }
  if (S_ISREG(st.st_mode)) {
    out.kind = FileStatus::Kind::Regular;
  } else if (S_ISDIR(st.st_mode)) {
    out.kind = FileStatus::Kind::Directory;
  } else {
    out.kind = FileStatus::Kind::Other;
  }
  out.size = static_cast<std::size_t>(st.st_size);
  out.mtime = SysTimePoint{std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_mtim.tv_sec} +
                                                                   std::chrono::nanoseconds{st.st_mtim.tv_nsec})};
  return 0;
}

int CheckReadable(const std::string& path) noexcept { return ::access(path.c_str(), R_OK) == 0 ? 0 : errno; }

}  // namespace statik
