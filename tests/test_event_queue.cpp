// Tests for the pollable event queue.
#include "spirc/event_queue.h"

#include <gtest/gtest.h>

#include <thread>

#include <sys/select.h>

namespace {

bool Readable(int fd) {
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  timeval tv{};
  return ::select(fd + 1, &readfds, nullptr, nullptr, &tv) > 0;
}

}  // namespace

TEST(EventQueueTest, EmptyQueueIsPending) {
  spirc::EventQueue<int> queue;
  int value = 0;
  std::string error;
  EXPECT_EQ(queue.Poll(&value, &error), spirc::PollResult::kPending);
  EXPECT_EQ(queue.size(), 0u);
}

TEST(EventQueueTest, DeliversInPushOrder) {
  spirc::EventQueue<int> queue;
  queue.Push(1);
  queue.Push(2);
  EXPECT_EQ(queue.size(), 2u);

  int value = 0;
  std::string error;
  ASSERT_EQ(queue.Poll(&value, &error), spirc::PollResult::kReady);
  EXPECT_EQ(value, 1);
  ASSERT_EQ(queue.Poll(&value, &error), spirc::PollResult::kReady);
  EXPECT_EQ(value, 2);
  EXPECT_EQ(queue.Poll(&value, &error), spirc::PollResult::kPending);
}

TEST(EventQueueTest, FailureFollowsQueuedItems) {
  spirc::EventQueue<int> queue;
  queue.Push(7);
  queue.Fail("audio device lost");

  int value = 0;
  std::string error;
  ASSERT_EQ(queue.Poll(&value, &error), spirc::PollResult::kReady);
  EXPECT_EQ(value, 7);
  EXPECT_EQ(queue.Poll(&value, &error), spirc::PollResult::kError);
  EXPECT_EQ(error, "audio device lost");
  EXPECT_EQ(queue.Poll(&value, &error), spirc::PollResult::kError);
}

TEST(EventQueueTest, PushWakesDescriptor) {
  spirc::EventQueue<int> queue;
  ASSERT_GE(queue.fd(), 0);
  EXPECT_FALSE(Readable(queue.fd()));

  queue.Push(1);
  EXPECT_TRUE(Readable(queue.fd()));

  int value = 0;
  std::string error;
  queue.Poll(&value, &error);
  EXPECT_EQ(queue.Poll(&value, &error), spirc::PollResult::kPending);
  EXPECT_FALSE(Readable(queue.fd()));
}

TEST(EventQueueTest, ConcurrentProducersLoseNothing) {
  spirc::EventQueue<int> queue;
  std::thread t1([&]() {
    for (int i = 0; i < 1000; ++i) {
      queue.Push(i);
    }
  });
  std::thread t2([&]() {
    for (int i = 0; i < 1000; ++i) {
      queue.Push(i);
    }
  });
  t1.join();
  t2.join();

  int count = 0;
  int value = 0;
  std::string error;
  while (queue.Poll(&value, &error) == spirc::PollResult::kReady) {
    ++count;
  }
  EXPECT_EQ(count, 2000);
}

TEST(ConnectionQueueTest, ReportsUsernames) {
  spirc::ConnectionQueue connections;
  connections.Connected("alice");

  spirc::ConnectionEvent event;
  std::string error;
  ASSERT_EQ(connections.Poll(&event, &error), spirc::PollResult::kReady);
  EXPECT_EQ(event.username, "alice");

  connections.Fail("session closed");
  EXPECT_EQ(connections.Poll(&event, &error), spirc::PollResult::kError);
  EXPECT_EQ(error, "session closed");
}
