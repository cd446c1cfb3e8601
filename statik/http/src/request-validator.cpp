#include "statik/request-validator.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "statik/cctype.hpp"
#include "statik/http-constants.hpp"

namespace statik {

namespace {

constexpr bool IsNameChar(char ch) { return isalpha(ch) || isdigit(ch) || ch == '_' || ch == '-' || ch == '~'; }

// segment = *name-char *( "." 1*name-char )
constexpr bool IsValidSegment(std::string_view segment) {
  std::size_t pos = 0;
  while (pos < segment.size() && IsNameChar(segment[pos])) {
    ++pos;
  }
  while (pos < segment.size()) {
    if (segment[pos] != '.') {
      return false;
    }
    const std::size_t extBeg = ++pos;
    while (pos < segment.size() && IsNameChar(segment[pos])) {
      ++pos;
    }
    if (pos == extBeg) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool IsValidPathname(std::string_view path) noexcept {
  if (!path.starts_with('/')) {
    return false;
  }
  path.remove_prefix(1);
  while (true) {
    const auto slashPos = path.find('/');
    const std::string_view segment = path.substr(0, slashPos);
    if (slashPos == std::string_view::npos) {
      // last segment, may be empty
      return IsValidSegment(segment);
    }
    if (segment.empty() || !IsValidSegment(segment)) {
      return false;
    }
    path.remove_prefix(slashPos + 1);
  }
}

ValidationFailure ValidateRequest(uint8_t versionMajor, uint8_t versionMinor, std::string_view method,
                                  std::string_view path) noexcept {
  if (versionMajor != 1 || versionMinor != 1) {
    return ValidationFailure::VersionUnsupported;
  }
  if (method != http::GET && method != http::HEAD) {
    return ValidationFailure::MethodNotAllowed;
  }
  if (!IsValidPathname(path)) {
    return ValidationFailure::InvalidPath;
  }
  return ValidationFailure::None;
}

}  // namespace statik
