#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace statik {

// What the transport needs to make progress after a non-blocking I/O operation.
enum class TransportHint : uint8_t {
  None,        // operation completed
  ReadReady,   // would block, wait for the socket to become readable
  WriteReady,  // would block, wait for the socket to become writable
  Error
};

// Non-blocking read / write on a plain socket fd.
class PlainTransport {
 public:
  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  // Returns bytes read. 0 with TransportHint::None means orderly close from the peer.
  TransportResult read(char* buf, std::size_t len);

  // Writes as much as possible of data, retrying on EINTR.
  // Never raises SIGPIPE, a closed peer is reported as TransportHint::Error.
  TransportResult write(std::string_view data);

 private:
  int _fd;
};

}  // namespace statik
