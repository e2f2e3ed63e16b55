#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "framelink/base-fd.hpp"
#include "framelink/event.hpp"

namespace framelink {

// Thin RAII wrapper over epoll.
// The event buffer starts with kInitialCapacity slots and doubles each time a poll fills it completely.
// add()/mod() return success/failure and log details on failure; caller decides the policy.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Throws std::system_error if epoll cannot be created.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Log on error.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns an empty span on timeout, on EINTR, and on poll failure (logged).
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_rawEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<epoll_event> _rawEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace framelink
