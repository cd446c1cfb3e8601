#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>

#include "statik/base-fd.hpp"
#include "statik/timedef.hpp"

namespace statik {

// Read-only file opened with O_CLOEXEC, with positional reads.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. On failure, operator bool() returns false and errno is preserved.
  explicit File(const std::string& path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // File size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset, retrying on EINTR.
  // Uses pread() so it does not modify the file's current offset.
  // Returns the number of bytes read (0 on EOF), or kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
};

struct FileStatus {
  enum class Kind : uint8_t { Regular, Directory, Other };

  Kind kind{Kind::Other};
  std::size_t size{};
  SysTimePoint mtime;
};

// stat(2) of given path, following symlinks. Returns 0 on success, the errno value otherwise.
[[nodiscard]] int FileStat(const std::string& path, FileStatus& out) noexcept;

// access(path, R_OK). Returns 0 if readable, the errno value otherwise.
[[nodiscard]] int CheckReadable(const std::string& path) noexcept;

}  // namespace statik
