#pragma once

#include <zlib.h>

#include <cstdint>

namespace statik {

// Owns a z_stream initialized for gzip compression.
struct ZStreamRAII {
  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(int8_t level);

  // z_stream holds internal pointers to itself, it is neither copyable nor moveable.
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace statik
