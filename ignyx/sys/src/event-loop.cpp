#include "ignyx/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "ignyx/errno-throw.hpp"
#include "ignyx/event.hpp"
#include "ignyx/log.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");
static_assert(EventEt == EPOLLET, "EventEt value mismatch");

epoll_event* AsEpollEvents(std::vector<unsigned char>& raw) { return reinterpret_cast<epoll_event*>(raw.data()); }

}  // namespace

EventLoop::EventLoop(SteadyDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count())),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _readyEvents(std::max(1U, initialCapacity)),
      _rawEvents(_readyEvents.size() * sizeof(epoll_event)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(int fd, EventBmp events) const {
  if (!add(fd, events)) {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", fd, events);
  }
}

bool EventLoop::add(int fd, EventBmp events) const {
  epoll_event ev{events, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, events, err, std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(int fd, EventBmp events) const {
  epoll_event ev{events, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, fd, &ev) != 0) {
    const auto err = errno;
    // A connection closed concurrently yields EBADF / ENOENT.
    if (err == EBADF || err == ENOENT) {
      log::debug("epoll_ctl MOD benign failure (fd # {}, errno={})", fd, err);
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, events, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll() {
  const auto capacityBeforePoll = _readyEvents.size();
  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), AsEpollEvents(_rawEvents), static_cast<int>(capacityBeforePoll), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (errno={}, msg={})", err, std::strerror(err));
    }
    return {};
  }

  const epoll_event* epollEvents = AsEpollEvents(_rawEvents);
  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _readyEvents[static_cast<std::size_t>(idx)] = Event{epollEvents[idx].data.fd, epollEvents[idx].events};
  }
  std::span<const Event> ready(_readyEvents.data(), static_cast<std::size_t>(nbReadyFds));

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    // Growing invalidates 'ready', so copy it into the new buffer first.
    std::vector<Event> grown(capacityBeforePoll * 2U);
    std::ranges::copy(ready, grown.begin());
    _readyEvents = std::move(grown);
    _rawEvents.resize(_readyEvents.size() * sizeof(epoll_event));
    ready = std::span<const Event>(_readyEvents.data(), static_cast<std::size_t>(nbReadyFds));
  }
  return ready;
}

}  // namespace ignyx
