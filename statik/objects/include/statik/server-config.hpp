#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "statik/static-file-config.hpp"

namespace statik {

struct ServerConfig {
  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 lets the OS pick an ephemeral free port, retrieved after construction via FileServer::port().
  uint16_t port{8000};

  // Enables SO_REUSEPORT, allowing several independent servers to bind the same port.
  bool reusePort{false};

  // Disables Nagle's algorithm on the listening socket (inherited by accepted connections).
  bool tcpNoDelay{false};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // When false, the server closes each connection after its first response regardless of client headers.
  bool enableKeepAlive{true};

  // ============================
  // Request parsing limits
  // ============================
  // Maximum size of the request head (request line + headers + CRLFCRLF).
  // Exceeding it results in a 431 response and connection closure.
  std::size_t maxHeaderBytes{8192};

  // Number of bytes requested per read system call.
  std::size_t readChunkBytes{4096};

  // =============================================
  // Outbound buffering & backpressure management
  // =============================================
  // Response body production is paused while at least this many bytes are queued for a connection.
  // It resumes when the socket becomes writable again, which bounds the memory used per connection.
  std::size_t outboundHighWaterMark{256UL * 1024UL};

  // ===========================================
  // Event loop polling / responsiveness tuning
  // ===========================================
  // Maximum duration of a single epoll_wait when idle, bounding the latency of stop() and runUntil checks.
  std::chrono::milliseconds pollInterval{500};

  // ============================
  // Served content
  // ============================
  StaticFileConfig staticFiles;

  ServerConfig& withPort(uint16_t port) {
    this->port = port;
    return *this;
  }

  ServerConfig& withReusePort(bool on = true) {
    reusePort = on;
    return *this;
  }

  ServerConfig& withTcpNoDelay(bool on = true) {
    tcpNoDelay = on;
    return *this;
  }

  ServerConfig& withKeepAliveMode(bool on = true) {
    enableKeepAlive = on;
    return *this;
  }

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes) {
    this->maxHeaderBytes = maxHeaderBytes;
    return *this;
  }

  ServerConfig& withReadChunkBytes(std::size_t readChunkBytes) {
    this->readChunkBytes = readChunkBytes;
    return *this;
  }

  ServerConfig& withOutboundHighWaterMark(std::size_t highWaterMark) {
    outboundHighWaterMark = highWaterMark;
    return *this;
  }

  ServerConfig& withPollInterval(std::chrono::milliseconds pollInterval) {
    this->pollInterval = pollInterval;
    return *this;
  }

  ServerConfig& withStaticFiles(StaticFileConfig staticFiles) {
    this->staticFiles = std::move(staticFiles);
    return *this;
  }
};

}  // namespace statik
