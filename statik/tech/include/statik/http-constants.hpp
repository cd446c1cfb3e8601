#pragma once

#include <string_view>

#include "statik/http-status-code.hpp"

namespace statik::http {

// Header field names are stored in their conventional canonical form for emission.
// Lookups in parsing code stay case-insensitive.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";

// Header field names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Vary = "Vary";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view IfRange = "If-Range";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view AccessControlAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view AccessControlAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Header values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view bytes = "bytes";
inline constexpr std::string_view AllowedMethods = "GET, HEAD";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view NoCache = "no-cache";
inline constexpr std::string_view MultipartByteRangesPrefix = "multipart/byteranges; boundary=";

// Terminal chunk of a chunked body, without trailers.
inline constexpr std::string_view LastChunk = "0\r\n\r\n";

inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonPartialContent = "Partial Content";
inline constexpr std::string_view ReasonNotModified = "Not Modified";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonRangeNotSatisfiable = "Range Not Satisfiable";
inline constexpr std::string_view ReasonRequestHeaderFieldsTooLarge = "Request Header Fields Too Large";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";

// Returns the standard reason phrase for the status codes emitted by this server, empty for others.
constexpr std::string_view ReasonPhraseFor(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRangeNotSatisfiable:
      return ReasonRangeNotSatisfiable;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonRequestHeaderFieldsTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace statik::http
