#pragma once

#include <cstdint>
#include <string_view>

namespace statik {

enum class ValidationFailure : uint8_t { None, VersionUnsupported, MethodNotAllowed, InvalidPath };

// Checks, in this order, that the version is HTTP/1.1, that the method is GET or HEAD,
// and that the path (query string stripped) is a valid pathname. Never touches the filesystem.
[[nodiscard]] ValidationFailure ValidateRequest(uint8_t versionMajor, uint8_t versionMinor, std::string_view method,
                                                std::string_view path) noexcept;

// A valid pathname is a '/' separated list of segments, starting with '/'.
// Each segment is made of characters among [A-Za-z0-9_~-], optionally followed by extensions
// ('.' followed by at least one of these characters). Only the last segment may be empty ("/" or "/dir/").
// Hence "." and ".." segments, empty segments ("//") and any other character are rejected.
[[nodiscard]] bool IsValidPathname(std::string_view path) noexcept;

}  // namespace statik
