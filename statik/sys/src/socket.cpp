#include "statik/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>

#include "statik/errno-throw.hpp"
#include "statik/log.hpp"
#include "statik/socket-ops.hpp"

namespace statik {

namespace {

int ToSocketType(Socket::Type type) {
  int ret = SOCK_STREAM | SOCK_CLOEXEC;
  if (type == Socket::Type::StreamNonBlock) {
    ret |= SOCK_NONBLOCK;
  }
  return ret;
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }
  if (tcpNoDelay && !SetTcpNoDelay(fd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed for port {}", port);
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    throw_errno("listen failed for port {}", port);
  }
  if (port == 0) {
    port = GetLocalPort(fd);
    if (port == 0) {
      throw_errno("getsockname failed");
    }
  }
}

}  // namespace statik
