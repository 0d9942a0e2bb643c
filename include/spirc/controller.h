#pragma once

#include "spirc/spirc.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spirc {

/**
 * Local view of the shared playback session, owned by one controller.
 */
struct PlaybackState {
  explicit PlaybackState(std::string display_name);

  std::string name;
  uint16_t volume = kVolumeMax;

  bool is_active = false;
  int64_t became_active_at = 0;
  PlayStatus status = PlayStatus::kStop;

  uint32_t index = 0;
  std::vector<TrackId> tracks;

  /// Logical clock; never decreases.
  int64_t update_id = 0;

  uint32_t position_ms = 0;
  uint64_t position_measured_at = 0;

  /// Replace the track list with the valid ids of a snapshot and adopt its index.
  void LoadTracks(const PlaybackSnapshot& snapshot);
  /// Whether index points into a non-empty track list.
  bool HasCurrentTrack() const { return index < tracks.size(); }

  PlaybackSnapshot Snapshot() const;
  DeviceDescriptor Descriptor(const std::string& sw_version) const;
};

using Event = std::variant<ConnectionEvent, Envelope, PlayerEvent, SendCompletion>;

/// (Re)open subscription and publisher on a topic, replacing prior handles.
struct OpenChannelAction {
  std::string topic;
};

struct SendFrameAction {
  Envelope envelope;
};

struct LoadTrackAction {
  TrackId track{};
};

struct StopPlaybackAction {};

using Action = std::variant<OpenChannelAction, SendFrameAction, LoadTrackAction,
                            StopPlaybackAction>;
using Actions = std::vector<Action>;

/**
 * Every field stamped onto an outbound envelope.
 */
struct FrameFields {
  MessageType type = MessageType::kNotify;
  std::string ident;
  uint32_t seq_nr = 0;
  DeviceDescriptor device;
  /// Single recipient for unicast; nullopt broadcasts.
  std::optional<std::string> recipient;
  std::optional<PlaybackSnapshot> state;
  int64_t state_update_id = 0;
};

/// Build a complete outbound envelope from its stamped fields.
Envelope BuildFrame(FrameFields fields);

/// Topic shared by all endpoints of one user.
std::string TopicForUser(const std::string& username);

/**
 * Inbound filter: false for frames sent by ident itself and for frames
 * targeted at other endpoints.
 */
bool ShouldDispatch(const Envelope& frame, const std::string& ident);

/**
 * Remote-control state machine.
 *
 * Handle() is the single transition function: it mutates the local playback
 * state and returns the channel, send and player actions the event produced,
 * in order. The controller performs no I/O.
 */
class Controller {
 public:
  explicit Controller(const Config& config);

  Actions Handle(const Event& event);

  const PlaybackState& state() const { return state_; }
  const std::string& ident() const { return ident_; }
  /// True once a connection event has opened a channel.
  bool connected() const { return connected_; }
  /// Last sequence number handed out (0 before the first send).
  uint32_t last_seq() const { return seq_nr_; }
  /// Frames dropped because no channel was open.
  uint64_t dropped_frames() const { return dropped_frames_; }

 private:
  void HandleConnection(const ConnectionEvent& event, Actions* actions);
  void ProcessFrame(const Envelope& frame, Actions* actions);
  void HandlePlayerEvent(const PlayerEvent& event, Actions* actions);
  void HandleSendCompletion(const SendCompletion& completion);

  void LoadCurrentTrack(int64_t now, Actions* actions);
  void AdvanceUpdateId(int64_t now);

  uint32_t NextSeq();
  void Command(MessageType type,
               std::optional<std::string> recipient,
               std::optional<PlaybackSnapshot> state,
               Actions* actions);
  void SendFrame(Envelope frame, Actions* actions);
  void Notify(std::optional<std::string> recipient, Actions* actions);

  int64_t Now() const;

  std::string ident_;
  std::string sw_version_;
  Config::WallClock clock_;
  Logger logger_;

  bool connected_ = false;
  uint32_t seq_nr_ = 0;
  uint64_t dropped_frames_ = 0;

  PlaybackState state_;
};

}  // namespace spirc
