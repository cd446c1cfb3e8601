#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "statik/timedef.hpp"

namespace statik::test {

// Unique temporary directory under the system temp directory, removed recursively on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "statik-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// File created inside an existing ScopedTempDir, removed on destruction.
// 'relativePath' may contain sub directories, they are created as needed (and left to the ScopedTempDir).
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::string_view content);

  // File of given size filled with a repeating printable pattern, kept in memory for content().
  ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::size_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

  // Sets both access and modification times. Throws std::system_error on failure.
  void setModificationTime(SysTimePoint tp) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace statik::test
