#include "statik/response-streamer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>

#include "statik/file.hpp"
#include "statik/http-constants.hpp"
#include "statik/log.hpp"
#include "statik/raw-chars.hpp"
#include "statik/response-intent.hpp"
#include "statik/stringconv.hpp"
#include "statik/zlib-encoder.hpp"

namespace statik {

namespace {

// Appends data as one chunk of a chunked body. Empty data is skipped, it would terminate the body.
void AppendChunk(std::string_view data, RawChars& out) {
  if (data.empty()) {
    return;
  }
  const auto sizeHex = IntegralToHexCharVector(data.size());
  out.ensureAvailableCapacityExponential(sizeHex.size() + data.size() + (2U * http::CRLF.size()));
  out.append(std::string_view(sizeHex));
  out.append(http::CRLF);
  out.append(data);
  out.append(http::CRLF);
}

}  // namespace

ResponseStreamer::ResponseStreamer(const ResponseIntent& intent, std::size_t fileChunkBytes, int8_t gzipLevel)
    : _body(intent.body),
      _headRequest(intent.headRequest),
      _fileChunkBytes(fileChunkBytes),
      _gzipLevel(gzipLevel),
      _ranges(intent.ranges),
      _boundary(intent.boundary),
      _errorBody(intent.errorBody) {
  if (intent.resource) {
    _path = intent.resource->path;
    _contentType = intent.resource->contentType;
    _fileSize = intent.resource->size;
  }
  switch (_body) {
    case BodyStrategy::Full:
      [[fallthrough]];
    case BodyStrategy::FullGzip:
      _end = _fileSize;
      break;
    case BodyStrategy::SingleRange:
      if (!_ranges.empty()) {
        _offset = _ranges.front().start;
        _end = _ranges.front().end + 1U;
      }
      break;
    default:
      break;
  }
}

StreamStep ResponseStreamer::produce(RawChars& out) {
  if (_done) {
    return StreamStep::Finished;
  }
  if (_headRequest) {
    return finish(StreamStep::Finished);
  }
  switch (_body) {
    case BodyStrategy::ErrorJson:
      return produceErrorBody(out);
    case BodyStrategy::Full:
      [[fallthrough]];
    case BodyStrategy::SingleRange:
      return produceWindow(out);
    case BodyStrategy::FullGzip:
      return produceGzip(out);
    case BodyStrategy::Multipart:
      return produceMultipart(out);
    default:
      return finish(StreamStep::Finished);
  }
}

StreamStep ResponseStreamer::produceErrorBody(RawChars& out) {
  out.append(_errorBody);
  return finish(StreamStep::Finished);
}

StreamStep ResponseStreamer::produceWindow(RawChars& out) {
  if (_offset == _end) {
    return finish(StreamStep::Finished);
  }
  if (!openFile()) {
    return finish(StreamStep::Failed);
  }
  const std::size_t len = std::min(_fileChunkBytes, _end - _offset);
  if (!readInto(out, _offset, len)) {
    return finish(StreamStep::Failed);
  }
  _offset += len;
  return _offset == _end ? finish(StreamStep::Finished) : StreamStep::Produced;
}

StreamStep ResponseStreamer::produceGzip(RawChars& out) {
  if (!openFile()) {
    return finish(StreamStep::Failed);
  }
  try {
    if (!_encoder) {
      _encoder = std::make_unique<ZlibEncoderContext>(_gzipLevel);
    }
    const std::size_t len = std::min(_fileChunkBytes, _end - _offset);
    _scratch.clear();
    if (len != 0 && !readInto(_scratch, _offset, len)) {
      return finish(StreamStep::Failed);
    }
    _offset += len;
    AppendChunk(_encoder->encodeChunk(_fileChunkBytes, _scratch), out);
    if (_offset != _end) {
      return StreamStep::Produced;
    }
    AppendChunk(_encoder->encodeChunk(_fileChunkBytes, {}), out);
  } catch (const std::runtime_error& ex) {
    log::error("gzip compression of '{}' failed: {}", _path, ex.what());
    return finish(StreamStep::Failed);
  }
  out.append(http::LastChunk);
  return finish(StreamStep::Finished);
}

StreamStep ResponseStreamer::produceMultipart(RawChars& out) {
  if (!openFile()) {
    return finish(StreamStep::Failed);
  }
  _scratch.clear();

  const ByteRange& range = _ranges[_partIdx];
  if (!_partStarted) {
    // part preamble, RFC 7233 appendix A
    _scratch.append("--");
    _scratch.append(_boundary);
    _scratch.append(http::CRLF);
    _scratch.append(http::ContentType);
    _scratch.append(http::HeaderSep);
    _scratch.append(_contentType);
    _scratch.append(http::CRLF);
    _scratch.append(http::ContentRange);
    _scratch.append(http::HeaderSep);
    _scratch.append(http::bytes);
    _scratch.push_back(' ');
    _scratch.append(std::string_view(IntegralToCharVector(range.start)));
    _scratch.push_back('-');
    _scratch.append(std::string_view(IntegralToCharVector(range.end)));
    _scratch.push_back('/');
    _scratch.append(std::string_view(IntegralToCharVector(_fileSize)));
    _scratch.append(http::DoubleCRLF);
    _offset = range.start;
    _end = range.end + 1U;
    _partStarted = true;
  }

  const std::size_t len = std::min(_fileChunkBytes, _end - _offset);
  if (!readInto(_scratch, _offset, len)) {
    return finish(StreamStep::Failed);
  }
  _offset += len;

  bool lastPart = false;
  if (_offset == _end) {
    _scratch.append(http::CRLF);
    _partStarted = false;
    lastPart = ++_partIdx == _ranges.size();
    if (lastPart) {
      _scratch.append("--");
      _scratch.append(_boundary);
      _scratch.append("--");
    }
  }

  AppendChunk(_scratch, out);
  if (!lastPart) {
    return StreamStep::Produced;
  }
  out.append(http::LastChunk);
  return finish(StreamStep::Finished);
}

bool ResponseStreamer::openFile() {
  if (_file) {
    return true;
  }
  _file = File(_path);
  if (!_file) {
    log::error("Unable to open '{}' for streaming: {}", _path, std::strerror(errno));
    return false;
  }
  return true;
}

bool ResponseStreamer::readInto(RawChars& dst, std::size_t offset, std::size_t maxLen) {
  dst.ensureAvailableCapacityExponential(maxLen);
  std::size_t nbRead = 0;
  while (nbRead < maxLen) {
    const std::size_t ret =
        _file.readAt(std::span<char>(dst.data() + dst.size() + nbRead, maxLen - nbRead), offset + nbRead);
    if (ret == File::kError) {
      log::error("Read of '{}' at offset {} failed: {}", _path, offset + nbRead, std::strerror(errno));
      return false;
    }
    if (ret == 0) {
      log::error("'{}' is shorter than expected ({} bytes missing at offset {})", _path, maxLen - nbRead,
                 offset + nbRead);
      return false;
    }
    nbRead += ret;
  }
  dst.addSize(nbRead);
  return true;
}

StreamStep ResponseStreamer::finish(StreamStep step) noexcept {
  _done = true;
  _file.close();
  _encoder.reset();
  return step;
}

}  // namespace statik
