#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "statik/byte-range.hpp"
#include "statik/http-header-map.hpp"
#include "statik/http-status-code.hpp"
#include "statik/raw-chars.hpp"
#include "statik/resource.hpp"

namespace statik {

enum class BodyStrategy : uint8_t {
  None,         // no body (304)
  Full,         // whole file, identity
  FullGzip,     // whole file, gzip compressed, chunked
  SingleRange,  // one byte window of the file
  Multipart,    // multipart/byteranges, chunked
  ErrorJson     // errorBody
};

// Decision record of the response pipeline: status, headers and how to produce the body.
// Headers are serialized exactly once, when the head is committed to the connection.
struct ResponseIntent {
  // Appends the status line and the header fields, followed by the empty line.
  void serializeHead(RawChars& out) const;

  // Whether the body is sent with chunked transfer coding (length unknown in advance).
  [[nodiscard]] bool chunked() const noexcept {
    return body == BodyStrategy::FullGzip || body == BodyStrategy::Multipart;
  }

  http::StatusCode status{http::StatusCodeOK};
  BodyStrategy body{BodyStrategy::None};
  bool headRequest{false};  // headers only, same as for GET
  bool committed{false};    // head handed to the connection, no other response can be substituted
  HeaderMap headers;
  std::optional<Resource> resource;
  std::vector<ByteRange> ranges;
  std::string boundary;
  std::string errorBody;
};

}  // namespace statik
