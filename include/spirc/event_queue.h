#pragma once

#include "spirc/collaborators.h"

#include <cerrno>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace spirc {

/**
 * Thread-safe FIFO polled without blocking.
 *
 * Producers call Push()/Fail() from any thread; the session polls from its
 * loop thread. fd() becomes readable after a push so an idle session wakes
 * early. The wakeup is best effort; the session's idle_wait bounds latency.
 */
template <typename T>
class EventQueue {
 public:
  EventQueue() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0) {
      read_fd_ = fds[0];
      write_fd_ = fds[1];
    }
  }

  ~EventQueue() {
    if (read_fd_ >= 0) {
      ::close(read_fd_);
    }
    if (write_fd_ >= 0) {
      ::close(write_fd_);
    }
  }

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push_back(std::move(item));
    }
    Wake();
  }

  /// Terminate the sequence: queued items are still delivered, then Poll fails.
  void Fail(std::string error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      error_ = std::move(error);
    }
    Wake();
  }

  PollResult Poll(T* out, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!items_.empty()) {
      if (out) {
        *out = std::move(items_.front());
      }
      items_.pop_front();
      return PollResult::kReady;
    }
    if (error_.has_value()) {
      if (error) {
        *error = error_.value();
      }
      return PollResult::kError;
    }
    Drain();
    return PollResult::kPending;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  int fd() const { return read_fd_; }

 private:
  void Wake() {
    if (write_fd_ < 0) {
      return;
    }
    const char byte = 1;
    // A full pipe already guarantees a pending wakeup.
    while (::write(write_fd_, &byte, 1) < 0 && errno == EINTR) {
    }
  }

  void Drain() {
    if (read_fd_ < 0) {
      return;
    }
    char buffer[64];
    while (::read(read_fd_, buffer, sizeof(buffer)) > 0) {
    }
  }

  mutable std::mutex mutex_;
  std::deque<T> items_;
  std::optional<std::string> error_;
  int read_fd_ = -1;
  int write_fd_ = -1;
};

/**
 * Connection-lifecycle source fed by the surrounding session layer.
 */
class ConnectionQueue : public ConnectionSource {
 public:
  /// Report a (re)connect for username.
  void Connected(const std::string& username) { queue_.Push(ConnectionEvent{username}); }
  void Fail(std::string error) { queue_.Fail(std::move(error)); }

  PollResult Poll(ConnectionEvent* out, std::string* error) override {
    return queue_.Poll(out, error);
  }
  int fd() const override { return queue_.fd(); }

 private:
  EventQueue<ConnectionEvent> queue_;
};

}  // namespace spirc
