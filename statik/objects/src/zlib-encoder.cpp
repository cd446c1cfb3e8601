#include "statik/zlib-encoder.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "statik/raw-chars.hpp"
#include "statik/zlib-stream-raii.hpp"

namespace statik {

ZlibEncoderContext::ZlibEncoderContext(int8_t level) : _zs(level) {}

std::string_view ZlibEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  _buf.clear();
  if (_finished) {
    if (!chunk.empty()) {
      throw std::runtime_error("gzip stream already finished");
    }
    return _buf;
  }

  _zs.stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
  _zs.stream.avail_in = static_cast<uInt>(chunk.size());

  const int flush = chunk.empty() ? Z_FINISH : Z_NO_FLUSH;
  do {
    _buf.ensureAvailableCapacityExponential(encoderChunkSize);

    const auto availableCapacity = _buf.availableCapacity();

    _zs.stream.next_out = reinterpret_cast<Bytef*>(_buf.data() + _buf.size());
    _zs.stream.avail_out = static_cast<uInt>(availableCapacity);

    const auto ret = deflate(&_zs.stream, flush);
    if (ret == Z_STREAM_ERROR) {
      throw std::runtime_error(fmt::format("Zlib streaming error {}", ret));
    }

    _buf.addSize(availableCapacity - _zs.stream.avail_out);

    if (ret == Z_STREAM_END) {
      _finished = true;
      break;
    }
  } while (_zs.stream.avail_out == 0 || _zs.stream.avail_in > 0);

  return _buf;
}

}  // namespace statik
