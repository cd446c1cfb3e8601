#include "statik/temp-file.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "statik/errno-throw.hpp"
#include "statik/log.hpp"
#include "statik/stringconv.hpp"
#include "statik/timedef.hpp"

namespace statik::test {

namespace {

std::mt19937_64& Rng() {
  static std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

void WriteFile(const std::filesystem::path& path, std::string_view content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempFile: unable to write " + path.string());
  }
}

std::string MakePattern(std::size_t size) {
  static constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::string content(size, '\0');
  for (std::size_t pos = 0; pos < size; ++pos) {
    content[pos] = kAlphabet[pos % kAlphabet.size()];
  }
  return content;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + std::string(std::string_view(IntegralToHexCharVector(dist(Rng())))));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::warn("ScopedTempDir: unable to remove {}: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::string_view content)
    : _path(dir.dirPath() / relativePath), _content(content) {
  WriteFile(_path, _content);
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view relativePath, std::size_t size)
    : _path(dir.dirPath() / relativePath), _content(MakePattern(size)) {
  WriteFile(_path, _content);
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::setModificationTime(SysTimePoint tp) const {
  const auto sinceEpoch = tp.time_since_epoch();
  const auto secs = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - secs);
  timespec times[2];
  times[0].tv_sec = static_cast<time_t>(secs.count());
  times[0].tv_nsec = static_cast<long>(nanos.count());
  times[1] = times[0];
  if (::utimensat(AT_FDCWD, _path.c_str(), times, 0) != 0) {
    throw_errno("utimensat failed for {}", _path.string());
  }
}

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    _path.clear();
  }
}

}  // namespace statik::test
