#pragma once

#include <cstdint>

namespace statik {

// Enable TCP_NODELAY (disable Nagle's algorithm). Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Local port bound to fd, in host byte order. Returns 0 on failure.
uint16_t GetLocalPort(int fd) noexcept;

// Shutdown the write half of a socket connection. Returns true on success.
bool ShutdownWrite(int fd) noexcept;

}  // namespace statik
