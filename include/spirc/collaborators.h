#pragma once

#include "spirc/spirc.h"

#include <memory>
#include <string>

namespace spirc {

/**
 * Result of a non-blocking poll on an event source.
 */
enum class PollResult {
  /// An item was written to the output argument.
  kReady,
  /// Nothing available right now.
  kPending,
  /// The source failed; the error argument describes why.
  kError,
};

enum class SendResult {
  kSent,
  /// Transport is busy; try the same payload again later.
  kWouldBlock,
  kFailed,
};

/**
 * Inbound side of a channel topic: a lazy sequence of raw payloads.
 */
class Subscription {
 public:
  virtual ~Subscription() = default;
  virtual PollResult Poll(std::string* payload, std::string* error) = 0;
  /// Descriptor that becomes readable when Poll may make progress, or -1.
  virtual int fd() const { return -1; }
};

/**
 * Outbound side of a channel topic.
 */
class Publisher {
 public:
  virtual ~Publisher() = default;
  virtual SendResult Send(const std::string& payload, std::string* error) = 0;
};

/**
 * Publish/subscribe transport keyed by topic.
 *
 * Both calls return nullptr and fill error on transport failure. Dropping the
 * returned handle releases the underlying resources.
 */
class MessageChannel {
 public:
  virtual ~MessageChannel() = default;
  virtual std::unique_ptr<Subscription> Subscribe(const std::string& topic,
                                                  std::string* error) = 0;
  virtual std::unique_ptr<Publisher> CreatePublisher(const std::string& topic,
                                                     std::string* error) = 0;
};

/**
 * Source of connection-lifecycle events.
 */
class ConnectionSource {
 public:
  virtual ~ConnectionSource() = default;
  virtual PollResult Poll(ConnectionEvent* out, std::string* error) = 0;
  virtual int fd() const { return -1; }
};

/**
 * Audio player. Load() and Stop() are fire-and-forget; completion and
 * failures are reported through PollEvent().
 */
class Player {
 public:
  virtual ~Player() = default;
  virtual void Load(const TrackId& track) = 0;
  virtual void Stop() = 0;
  virtual PollResult PollEvent(PlayerEvent* out, std::string* error) = 0;
  virtual int fd() const { return -1; }
};

}  // namespace spirc
