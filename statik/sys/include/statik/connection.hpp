#pragma once

#include "statik/base-fd.hpp"
#include "statik/socket.hpp"

namespace statik {

// An accepted, non-blocking client connection.
class Connection {
 public:
  // Accepts one pending connection on given listening socket.
  // Check operator bool(): false when nothing is pending (EAGAIN) or accept failed (logged).
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Error number of a failed accept, 0 otherwise.
  [[nodiscard]] int acceptErrno() const noexcept { return _acceptErrno; }

  void close() noexcept { _baseFd.close(); }

 private:
  // Declared first, it is written while _baseFd is initialized.
  int _acceptErrno{0};
  BaseFd _baseFd;
};

}  // namespace statik
