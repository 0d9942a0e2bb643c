#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spirc {

class Session;
class Controller;

#ifdef SPIRC_TESTING
namespace test {
bool Tick(Session& session);
size_t PendingFrameCount(Session& session);
const Controller& GetController(Session& session);
}  // namespace test
#endif

/**
 * Protocol constants.
 */
constexpr uint16_t kVolumeMax = 0xffff;
constexpr size_t kTrackIdLength = 16;
constexpr int64_t kVolumeSteps = 10;
constexpr const char* kTopicPrefix = "hm://remote/user/";
constexpr const char* kDefaultSwVersion = "spirc-cpp-0.1";

/**
 * Message type identifiers carried in every envelope (wire values).
 */
enum class MessageType : uint8_t {
  kHello = 0x01,
  kGoodbye = 0x02,
  kProbe = 0x03,
  kNotify = 0x0a,
  kLoad = 0x14,
  kPlay = 0x15,
  kPause = 0x16,
  kPlayPause = 0x17,
  kSeek = 0x18,
  kPrev = 0x19,
  kNext = 0x1a,
  kVolume = 0x1b,
  kShuffle = 0x1c,
  kRepeat = 0x1d,
  kVolumeDown = 0x1f,
  kVolumeUp = 0x20,
  kReplace = 0x21,
  kLogout = 0x22,
  kAction = 0x23,
  kRename = 0x24,
};

enum class PlayStatus : uint8_t {
  kStop = 0x00,
  kPlay = 0x01,
  kPause = 0x02,
  kLoading = 0x03,
};

/**
 * Capability identifiers advertised in the device descriptor.
 */
enum class CapabilityType : uint8_t {
  kSupportedContexts = 0x01,
  kCanBePlayer = 0x02,
  kRestrictToLocal = 0x03,
  kDeviceType = 0x04,
  kGaiaEqConnectId = 0x05,
  kSupportsLogout = 0x06,
  kIsObservable = 0x07,
  kVolumeSteps = 0x08,
  kSupportedTypes = 0x09,
  kCommandAcks = 0x0a,
  kSupportsRename = 0x0b,
};

/// Raw 128-bit track identifier.
using TrackId = std::array<uint8_t, kTrackIdLength>;

/// Render a track id as 32 lowercase hex digits.
std::string TrackIdToHex(const TrackId& id);
/// Parse 32 hex digits into a track id.
bool TrackIdFromHex(const std::string& text, TrackId* out);

/// Human readable message type name for logs.
const char* MessageTypeName(MessageType type);

struct Capability {
  CapabilityType type = CapabilityType::kCanBePlayer;
  std::vector<int64_t> int_values;
  std::vector<std::string> string_values;
};

/// Fixed capability list advertised by every endpoint built on this library.
std::vector<Capability> DefaultCapabilities();

/**
 * Self-description attached to every outbound envelope.
 */
struct DeviceDescriptor {
  /// Software version string of the sender.
  std::string sw_version;
  /// Display name of the sender.
  std::string name;
  /// Whether the sender currently owns playback.
  bool is_active = false;
  /// Whether the sender can produce audio.
  bool can_play = true;
  /// Output volume (0..65535).
  uint16_t volume = 0;
  uint32_t error_code = 0;
  /// Millisecond timestamp of the last active claim; meaningful when is_active.
  int64_t became_active_at = 0;
  std::vector<Capability> capabilities;
};

/**
 * Reference to a track inside a playback snapshot.
 */
struct TrackRef {
  /// Track id, present only when the wire gid had exactly 16 bytes.
  std::optional<TrackId> gid;
  std::string uri;
};

/**
 * Wire view of the shared playback state.
 */
struct PlaybackSnapshot {
  PlayStatus status = PlayStatus::kStop;
  uint32_t position_ms = 0;
  /// Wall-clock ms at which position_ms was sampled.
  uint64_t position_measured_at = 0;
  uint32_t playing_track_index = 0;
  std::vector<TrackRef> tracks;
  bool playing_from_fallback = true;
};

/**
 * Decoded protocol message exchanged over the per-user topic.
 */
struct Envelope {
  MessageType type = MessageType::kHello;
  /// Identity of the sending endpoint.
  std::string ident;
  /// Target endpoints; empty means broadcast.
  std::vector<std::string> recipients;
  /// Per-sender sequence number.
  uint32_t seq_nr = 0;
  /// Logical clock of the sender's last authoritative state change.
  int64_t state_update_id = 0;
  DeviceDescriptor device;
  /// Attached playback state (Load, Notify).
  std::optional<PlaybackSnapshot> state;
  /// Carried value for volume commands.
  std::optional<uint32_t> volume;
  /// Carried value for seek commands.
  std::optional<uint32_t> position;
};

/**
 * Connection-lifecycle event: emitted on every connect and reconnect.
 */
struct ConnectionEvent {
  std::string username;
};

enum class PlayerEventType {
  kTrackEnded,
  kPositionUpdate,
};

/**
 * Event reported by the audio player.
 */
struct PlayerEvent {
  PlayerEventType type = PlayerEventType::kTrackEnded;
  /// Current position for kPositionUpdate.
  uint32_t position_ms = 0;
};

/**
 * Outcome of one publish attempt, fed back into the controller.
 */
struct SendCompletion {
  uint32_t seq_nr = 0;
  MessageType type = MessageType::kNotify;
  bool ok = true;
  std::string error;
};

enum class LogLevel {
  kError = 0,
  kWarn = 1,
  kInfo = 2,
  kDebug = 3,
  kTrace = 4,
};

const char* LogLevelName(LogLevel level);

/**
 * What the session does when the publisher rejects a frame.
 */
enum class SendFailurePolicy {
  /// Log and drop the frame immediately.
  kDrop,
  /// Keep the frame and retry on later ticks, up to send_max_retries.
  kRetry,
};

/**
 * Lightweight counters for frame flow and error reporting.
 */
struct SessionMetrics {
  uint64_t frames_received = 0;
  uint64_t frames_dispatched = 0;
  uint64_t frames_filtered = 0;
  uint64_t frames_sent = 0;
  uint64_t frames_dropped = 0;
  uint64_t send_errors = 0;
  uint64_t decode_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Session configuration for identity, logging and outbound behavior.
 */
struct Config {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  using WallClock = std::function<int64_t()>;

  /// Display name advertised in the device descriptor.
  std::string device_name = "spirc-cpp";
  /// Stable identity of this endpoint on the shared topic.
  std::string device_id;
  /// Software version advertised in the device descriptor.
  std::string sw_version = kDefaultSwVersion;

  /// Lines above this level are discarded.
  LogLevel log_level = LogLevel::kInfo;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;
  /// Optional wall clock in ms since epoch (defaults to the system clock).
  WallClock clock;

  /// Upper bound on how long an idle session sleeps before polling again.
  std::chrono::milliseconds idle_wait{20};
  /// Maximum number of encoded frames waiting for the publisher.
  size_t max_pending_frames = 64;
  /// Behavior when the publisher rejects a frame.
  SendFailurePolicy send_failure_policy = SendFailurePolicy::kRetry;
  /// Retry budget per frame under SendFailurePolicy::kRetry.
  int send_max_retries = 3;
  /// Minimum delay between attempts to send the same frame.
  std::chrono::milliseconds send_retry_backoff{100};

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Leveled logger bound to a Config's level and callback.
 */
class Logger {
 public:
  Logger() = default;
  Logger(LogLevel level, Config::LogCallback callback);

  bool Enabled(LogLevel level) const { return level <= level_; }
  void Log(LogLevel level, const std::string& message) const;

  void Error(const std::string& message) const { Log(LogLevel::kError, message); }
  void Warn(const std::string& message) const { Log(LogLevel::kWarn, message); }
  void Info(const std::string& message) const { Log(LogLevel::kInfo, message); }
  void Debug(const std::string& message) const { Log(LogLevel::kDebug, message); }
  void Trace(const std::string& message) const { Log(LogLevel::kTrace, message); }

 private:
  LogLevel level_ = LogLevel::kInfo;
  Config::LogCallback callback_;
};

class MessageChannel;
class ConnectionSource;
class Player;

/**
 * Remote-control session: merges connection events, inbound frames, the
 * outbound publisher and player events into controller transitions.
 *
 * The channel, connection source and player must outlive the session.
 */
class Session {
 public:
  using FrameCallback = std::function<void(const Envelope&)>;

  Session(Config config,
          MessageChannel& channel,
          ConnectionSource& connections,
          Player& player);
  /// Stop the loop thread and release the channel handles.
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Validate the configuration and start the loop thread.
  bool Start();
  /// Stop the loop thread and release the subscription and publisher.
  void Stop();
  /// True while the loop thread is running (false after a fatal error).
  bool IsRunning() const;

  /// Set callback invoked for each inbound frame that passed filtering.
  void SetFrameCallback(FrameCallback cb);

  /// Return the error that stopped the session, if any.
  std::string GetLastError() const;
  /// Return metrics for frames, errors, and callbacks.
  SessionMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef SPIRC_TESTING
  friend bool test::Tick(Session& session);
  friend size_t test::PendingFrameCount(Session& session);
  friend const Controller& test::GetController(Session& session);
#endif
};

}  // namespace spirc
