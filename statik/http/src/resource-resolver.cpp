#include "statik/resource-resolver.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "statik/file.hpp"
#include "statik/log.hpp"
#include "statik/mime-mappings.hpp"

namespace statik {

namespace {

ResourceResolver::Status StatusFromErrno(int err) {
  switch (err) {
    case ENOENT:
      [[fallthrough]];
    case ENOTDIR:
      [[fallthrough]];
    case ENAMETOOLONG:
      [[fallthrough]];
    case ELOOP:
      return ResourceResolver::Status::NotFound;
    case EACCES:
      [[fallthrough]];
    case EPERM:
      return ResourceResolver::Status::PermissionDenied;
    default:
      return ResourceResolver::Status::OtherIOError;
  }
}

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto [rootEnd, candidateIt] = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
  return rootEnd == root.end();
}

}  // namespace

ResourceResolver::ResourceResolver(std::string_view rootDirectory, std::string_view defaultIndex)
    : _defaultIndex(defaultIndex) {
  if (_defaultIndex.empty() || _defaultIndex.contains('/') || _defaultIndex.contains('\\')) {
    throw std::invalid_argument(fmt::format("Invalid default index name '{}'", defaultIndex));
  }
  std::error_code ec;
  _root = std::filesystem::canonical(std::filesystem::path(rootDirectory), ec);
  if (ec || !std::filesystem::is_directory(_root, ec)) {
    throw std::invalid_argument(fmt::format("Root directory '{}' is not an existing directory", rootDirectory));
  }
  log::info("Serving files from {}", _root.string());
}

ResourceResolver::Result ResourceResolver::resolve(std::string_view validatedPath) const {
  Result ret;

  // validated paths start with '/', they are relative to the root
  std::filesystem::path candidate = _root;
  if (validatedPath.size() > 1) {
    candidate /= validatedPath.substr(1);
  }

  FileStatus fileStatus;
  std::string candidateStr = candidate.string();
  ret.err = FileStat(candidateStr, fileStatus);
  if (ret.err != 0) {
    ret.status = StatusFromErrno(ret.err);
    return ret;
  }

  if (fileStatus.kind == FileStatus::Kind::Directory) {
    candidate /= _defaultIndex;
    candidateStr = candidate.string();
    ret.err = FileStat(candidateStr, fileStatus);
    if (ret.err != 0) {
      ret.status = Status::NotFound;
      return ret;
    }
  }

  if (fileStatus.kind != FileStatus::Kind::Regular) {
    ret.status = Status::NotFound;
    return ret;
  }

  std::error_code ec;
  std::filesystem::path canonicalPath = std::filesystem::canonical(candidate, ec);
  if (ec) {
    ret.err = ec.value();
    ret.status = StatusFromErrno(ret.err);
    return ret;
  }
  if (!IsWithin(_root, canonicalPath)) {
    log::warn("'{}' resolves outside of the root directory", candidateStr);
    ret.status = Status::NotFound;
    return ret;
  }

  ret.resource.path = canonicalPath.string();
  ret.err = CheckReadable(ret.resource.path);
  if (ret.err != 0) {
    log::debug("'{}' is not readable: {}", ret.resource.path, std::strerror(ret.err));
    ret.status = StatusFromErrno(ret.err);
    return ret;
  }

  ret.status = Status::Ok;
  ret.resource.size = fileStatus.size;
  ret.resource.mtime = fileStatus.mtime;
  // MIME type from the requested name, a symlink target may have a different extension
  ret.resource.contentType = ContentTypeForPath(candidateStr);
  return ret;
}

}  // namespace statik
