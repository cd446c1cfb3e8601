#include "statik/zlib-stream-raii.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>

#include "statik/log.hpp"

namespace statik {

namespace {
// + 16: gzip header and trailer instead of the zlib ones
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;
}  // namespace

ZStreamRAII::ZStreamRAII(int8_t level) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = deflateEnd(&stream);
  // Z_DATA_ERROR is expected when the stream is released before Z_FINISH, like for aborted responses
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: deflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace statik
