#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "statik/resource.hpp"

namespace statik {

// Maps validated request paths to regular files under a root directory.
class ResourceResolver {
 public:
  enum class Status : uint8_t { Ok, NotFound, PermissionDenied, OtherIOError };

  struct Result {
    Status status{Status::NotFound};
    int err{0};  // errno of the failing call, 0 if none
    Resource resource;
  };

  // The root directory is canonicalized once here.
  // Throws std::invalid_argument if it is not an existing directory, or if defaultIndex contains a path separator.
  ResourceResolver(std::string_view rootDirectory, std::string_view defaultIndex);

  // Resolves a path previously accepted by IsValidPathname.
  // A directory resolves to its default index file. Anything that is not a regular file inside the root
  // directory once symlinks are resolved is reported as NotFound.
  [[nodiscard]] Result resolve(std::string_view validatedPath) const;

  [[nodiscard]] const std::filesystem::path& rootDirectory() const noexcept { return _root; }

 private:
  std::filesystem::path _root;
  std::string _defaultIndex;
};

}  // namespace statik
