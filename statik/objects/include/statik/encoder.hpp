#pragma once

#include <cstddef>
#include <string_view>

namespace statik {

// Stateful streaming compressor, confined to a single response.
// Usage:
//   for (chunk : chunks) { queue(ctx.encodeChunk(chunkSize, chunk)); }
//   queue(ctx.encodeChunk(chunkSize, {}));  // empty chunk finalizes the stream
// Returned views stay valid until the next call. Implementations throw std::runtime_error on codec failures.
class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  virtual std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) = 0;
};

}  // namespace statik
