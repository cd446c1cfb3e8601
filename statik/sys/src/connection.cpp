#include "statik/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "statik/base-fd.hpp"
#include "statik/log.hpp"
#include "statik/socket.hpp"

namespace statik {

namespace {

int AcceptConnectionFd(int socketFd, int& acceptErrno) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  const int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    acceptErrno = errno;
    if (acceptErrno == EAGAIN || acceptErrno == EWOULDBLOCK) {
      log::trace("No pending connection on socket fd # {}", socketFd);
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(acceptErrno));
    }
    return BaseFd::kClosedFd;
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptConnectionFd(socket.fd(), _acceptErrno)) {}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

}  // namespace statik
