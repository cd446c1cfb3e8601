#include "statik/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "statik/errno-throw.hpp"
#include "statik/event.hpp"
#include "statik/log.hpp"
#include "statik/timedef.hpp"

namespace statik {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");
static_assert(EventEt == EPOLLET, "EventEt value mismatch");

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count())),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}): {}", event.fd, event.eventBmp, std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) {
    const auto err = errno;
    // EBADF or ENOENT happen when the connection is being torn down concurrently
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}): {}", event.fd, event.eventBmp,
                std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}): {}", event.fd, event.eventBmp, std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    log::debug("epoll_ctl DEL failed (fd # {}): {}", fd, std::strerror(errno));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  _readyEvents.clear();

  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      log::error("epoll_wait failed (timeout_ms={}): {}", _pollTimeoutMs, std::strerror(errno));
    }
    return {};
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    const epoll_event& ev = _epollEvents[static_cast<std::size_t>(idx)];
    _readyEvents.push_back(EventFd{ev.data.fd, ev.events});
  }

  if (std::cmp_equal(nbReadyFds, _epollEvents.size())) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }

  return _readyEvents;
}

}  // namespace statik
