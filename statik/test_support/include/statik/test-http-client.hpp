#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "statik/http-status-code.hpp"
#include "statik/socket.hpp"

namespace statik::test {

using namespace std::chrono_literals;

// Blocking loopback client socket, connected on construction (retrying until timeout).
class ClientConnection {
 public:
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response for test assertions.
struct ParsedResponse {
  // Case-insensitive header lookup, first occurrence.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

  [[nodiscard]] bool hasHeader(std::string_view name) const { return header(name).has_value(); }

  [[nodiscard]] std::size_t headerCount(std::string_view name) const;

  http::StatusCode statusCode{0};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;  // in received order
  bool chunked{false};
  std::string body;          // de-chunked if chunked
  std::size_t consumed{0};   // number of raw bytes used by this response
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string version{"HTTP/1.1"};
  std::string connection{"close"};  // omitted when empty
  std::vector<std::pair<std::string, std::string>> headers;
};

std::string buildRequest(const RequestOptions& opt);

void sendAll(int fd, std::string_view data);

void setRecvTimeout(int fd, std::chrono::milliseconds timeout);

// Reads until the peer closes the connection (or the receive timeout expires).
std::string recvUntilClosed(int fd);

// Parses the first complete response in raw.
// Returns std::nullopt if raw does not yet hold a complete response (head, and body per Content-Length or chunked
// framing). 'noBody' must be set for responses to HEAD requests.
std::optional<ParsedResponse> parseResponse(std::string_view raw, bool noBody = false);

// Reads from fd until one complete response is available in buffer, then removes it from buffer.
// Returns std::nullopt on timeout or connection close before completion.
std::optional<ParsedResponse> recvResponse(int fd, std::string& buffer, bool noBody = false);

// Sends one request on a new connection and returns all raw bytes received until close.
std::string request(uint16_t port, const RequestOptions& opt = {});

// Same as request, parsed. Throws std::runtime_error if the response is incomplete.
ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// Number of non-overlapping occurrences of needle in haystack.
std::size_t countOccurrences(std::string_view haystack, std::string_view needle);

// Inflates gzip data (zlib auto header detection). Throws std::runtime_error on corrupt input.
std::string gunzip(std::string_view compressed);

}  // namespace statik::test
