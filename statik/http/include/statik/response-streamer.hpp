#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "statik/byte-range.hpp"
#include "statik/encoder.hpp"
#include "statik/file.hpp"
#include "statik/raw-chars.hpp"
#include "statik/response-intent.hpp"

namespace statik {

enum class StreamStep : uint8_t {
  Produced,  // some body bytes were appended, more will follow
  Finished,  // body complete (the last bytes may have been appended by this step)
  Failed     // body cannot be completed
};

// Pull based producer of the body of a ResponseIntent, one bounded step at a time.
// Each step reads at most fileChunkBytes bytes of the file, so the caller controls memory usage
// by only calling produce while its outbound buffer is below its high water mark.
// The file is opened lazily on the first step and released as soon as the stream ends or fails.
class ResponseStreamer {
 public:
  ResponseStreamer(const ResponseIntent& intent, std::size_t fileChunkBytes, int8_t gzipLevel);

  // Appends the next part of the body (including chunked framing when needed) to out.
  [[nodiscard]] StreamStep produce(RawChars& out);

  [[nodiscard]] bool done() const noexcept { return _done; }

 private:
  StreamStep produceErrorBody(RawChars& out);
  StreamStep produceWindow(RawChars& out);
  StreamStep produceGzip(RawChars& out);
  StreamStep produceMultipart(RawChars& out);

  bool openFile();

  // Reads up to maxLen bytes at offset, appended to dst. Returns false on error or premature end of file.
  bool readInto(RawChars& dst, std::size_t offset, std::size_t maxLen);

  StreamStep finish(StreamStep step) noexcept;

  BodyStrategy _body;
  bool _headRequest;
  bool _done{false};
  std::size_t _fileChunkBytes;
  int8_t _gzipLevel;

  std::string _path;
  std::string _contentType;
  std::size_t _fileSize{0};
  std::vector<ByteRange> _ranges;
  std::string _boundary;
  std::string _errorBody;

  File _file;
  std::unique_ptr<EncoderContext> _encoder;
  RawChars _scratch;

  // current window [_offset, _end) of the file, and current multipart part
  std::size_t _offset{0};
  std::size_t _end{0};
  std::size_t _partIdx{0};
  bool _partStarted{false};
};

}  // namespace statik
