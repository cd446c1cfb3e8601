#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "statik/base-fd.hpp"
#include "statik/event.hpp"
#include "statik/timedef.hpp"

namespace statik {

// Thin RAII wrapper over epoll.
// The ready-events buffer starts at kInitialCapacity slots and doubles each time a poll saturates it.
// It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify events of a registered fd. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Stop monitoring fd. Failures are logged only.
  void del(int fd) const;

  // Waits for ready events up to the poll timeout.
  // Returns a span over an internal buffer, valid until the next call.
  // Empty on timeout, on EINTR and on unrecoverable failure (logged).
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace statik
