#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "statik/encoder.hpp"
#include "statik/raw-chars.hpp"
#include "statik/zlib-stream-raii.hpp"

namespace statik {

// gzip streaming encoder.
class ZlibEncoderContext : public EncoderContext {
 public:
  explicit ZlibEncoderContext(int8_t level);

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

  [[nodiscard]] bool finished() const noexcept { return _finished; }

 private:
  RawChars _buf;
  ZStreamRAII _zs;
  bool _finished{false};
};

}  // namespace statik
