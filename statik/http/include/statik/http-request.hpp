#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace statik {

// Parsed HTTP/1.x request head (request line and header fields).
// The head bytes are copied so that the request stays valid after the connection buffer is consumed.
// All string_view accessors point into this internal copy, which is why the object cannot be copied nor moved.
class HttpRequest {
 public:
  enum class ParseStatus : uint8_t {
    NeedMore,        // head terminator not received yet
    Ok,              // head fully parsed, headLength() bytes can be dropped from the buffer
    BadRequest,      // malformed request line or header field
    HeadersTooLarge  // head larger than the configured maximum
  };

  HttpRequest() = default;

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) = delete;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest& operator=(HttpRequest&&) = delete;

  ~HttpRequest() = default;

  // Attempts to parse a request head at the beginning of buffer.
  // Empty lines preceding the request line are ignored (RFC 9112 section 2.2).
  ParseStatus parse(std::string_view buffer, std::size_t maxHeaderBytes);

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Raw request target, as received.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Request target without its query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query string (without '?'), empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] uint8_t versionMajor() const noexcept { return _versionMajor; }
  [[nodiscard]] uint8_t versionMinor() const noexcept { return _versionMinor; }

  // Value of the first header field with this name (case-insensitive), trimmed from surrounding whitespace.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::size_t nbHeaders() const noexcept { return _headers.size(); }

  // Number of bytes of the parsed head in the buffer, including leading empty lines and the final CRLFCRLF.
  [[nodiscard]] std::size_t headLength() const noexcept { return _headLength; }

  // Whether the Connection header holds the 'close' token.
  [[nodiscard]] bool wantsClose() const noexcept;

  // Whether the request announces a body (Transfer-Encoding, or non zero Content-Length).
  [[nodiscard]] bool hasBody() const noexcept;

 private:
  void reset() noexcept;

  ParseStatus parseHead(std::string_view head);

  std::string _head;
  std::string_view _method;
  std::string_view _target;
  std::string_view _path;
  std::string_view _query;
  std::vector<std::pair<std::string_view, std::string_view>> _headers;
  std::size_t _headLength{0};
  uint8_t _versionMajor{0};
  uint8_t _versionMinor{0};
};

}  // namespace statik
