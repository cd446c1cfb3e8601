#pragma once

#include <cstddef>
#include <string>

#include "statik/timedef.hpp"

namespace statik {

// Filesystem resource served for a request, resolved once and immutable afterwards.
struct Resource {
  std::string path;  // absolute, canonical
  std::size_t size{};
  SysTimePoint mtime;       // as reported by stat, nanosecond precision
  std::string contentType;  // Content-Type value, charset included for text types
};

}  // namespace statik
