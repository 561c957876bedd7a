#include "ignyx/event-loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <system_error>

#include "ignyx/event-fd.hpp"
#include "ignyx/event.hpp"

namespace ignyx {

using namespace std::chrono_literals;

TEST(EventLoop, TimeoutYieldsNoEvent) {
  EventLoop loop(1ms);
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, EventFdWakesUpThePoll) {
  EventLoop loop(100ms);
  EventFd wakeupFd;
  loop.addOrThrow(wakeupFd.fd(), EventIn);

  wakeupFd.send();
  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeupFd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);

  // Level triggered: draining the counter clears readiness.
  wakeupFd.read();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, ModAndDel) {
  EventLoop loop(1ms);
  EventFd wakeupFd;
  EXPECT_TRUE(loop.add(wakeupFd.fd(), EventIn));
  EXPECT_TRUE(loop.mod(wakeupFd.fd(), EventIn | EventOut));
  // An eventfd is always writable.
  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_NE(events[0].eventBmp & EventOut, 0U);

  loop.del(wakeupFd.fd());
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, AddInvalidFdThrows) {
  EventLoop loop(1ms);
  EXPECT_THROW(loop.addOrThrow(-1, EventIn), std::system_error);
  EXPECT_FALSE(loop.add(-1, EventIn));
}

TEST(EventLoop, CapacityGrowsWhenSaturated) {
  EventLoop loop(1ms, 1);
  EventFd fd1;
  EventFd fd2;
  loop.addOrThrow(fd1.fd(), EventOut);
  loop.addOrThrow(fd2.fd(), EventOut);
  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_GT(loop.capacity(), 1U);
  EXPECT_EQ(loop.poll().size(), 2U);
}

}  // namespace ignyx
