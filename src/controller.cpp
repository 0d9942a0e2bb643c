#include "spirc/controller.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

namespace spirc {
namespace {

int64_t SystemTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

PlaybackState::PlaybackState(std::string display_name)
    : name(std::move(display_name)) {}

void PlaybackState::LoadTracks(const PlaybackSnapshot& snapshot) {
  index = snapshot.playing_track_index;
  tracks.clear();
  tracks.reserve(snapshot.tracks.size());
  for (const auto& track : snapshot.tracks) {
    if (track.gid.has_value()) {
      tracks.push_back(track.gid.value());
    }
  }
}

PlaybackSnapshot PlaybackState::Snapshot() const {
  PlaybackSnapshot snapshot;
  snapshot.status = status;
  snapshot.position_ms = position_ms;
  snapshot.position_measured_at = position_measured_at;
  snapshot.playing_track_index = index;
  snapshot.tracks.reserve(tracks.size());
  for (const auto& track : tracks) {
    TrackRef ref;
    ref.gid = track;
    snapshot.tracks.push_back(std::move(ref));
  }
  snapshot.playing_from_fallback = true;
  return snapshot;
}

DeviceDescriptor PlaybackState::Descriptor(const std::string& sw_version) const {
  DeviceDescriptor device;
  device.sw_version = sw_version;
  device.name = name;
  device.is_active = is_active;
  device.can_play = true;
  device.volume = volume;
  device.error_code = 0;
  device.became_active_at = became_active_at;
  device.capabilities = DefaultCapabilities();
  return device;
}

Envelope BuildFrame(FrameFields fields) {
  Envelope frame;
  frame.type = fields.type;
  frame.ident = std::move(fields.ident);
  frame.seq_nr = fields.seq_nr;
  frame.device = std::move(fields.device);
  if (fields.recipient.has_value()) {
    frame.recipients.push_back(std::move(fields.recipient.value()));
  }
  if (fields.state.has_value()) {
    frame.state = std::move(fields.state);
    frame.state_update_id = fields.state_update_id;
  }
  return frame;
}

std::string TopicForUser(const std::string& username) {
  return std::string(kTopicPrefix) + username;
}

bool ShouldDispatch(const Envelope& frame, const std::string& ident) {
  if (frame.ident == ident) {
    return false;
  }
  if (frame.recipients.empty()) {
    return true;
  }
  return std::find(frame.recipients.begin(), frame.recipients.end(), ident) !=
         frame.recipients.end();
}

Controller::Controller(const Config& config)
    : ident_(config.device_id),
      sw_version_(config.sw_version),
      clock_(config.clock),
      logger_(config.log_level, config.log_callback),
      state_(config.device_name) {}

Actions Controller::Handle(const Event& event) {
  Actions actions;
  if (const auto* connection = std::get_if<ConnectionEvent>(&event)) {
    HandleConnection(*connection, &actions);
  } else if (const auto* frame = std::get_if<Envelope>(&event)) {
    ProcessFrame(*frame, &actions);
  } else if (const auto* player_event = std::get_if<PlayerEvent>(&event)) {
    HandlePlayerEvent(*player_event, &actions);
  } else if (const auto* completion = std::get_if<SendCompletion>(&event)) {
    HandleSendCompletion(*completion);
  }
  return actions;
}

void Controller::HandleConnection(const ConnectionEvent& event, Actions* actions) {
  logger_.Debug("connected(username=" + event.username + ")");
  connected_ = true;
  actions->push_back(OpenChannelAction{TopicForUser(event.username)});
  Command(MessageType::kHello, std::nullopt, std::nullopt, actions);
}

void Controller::ProcessFrame(const Envelope& frame, Actions* actions) {
  if (frame.state_update_id > state_.update_id) {
    state_.update_id = frame.state_update_id;
  }

  // Last claim wins: a peer that became active after us takes over playback.
  if (frame.device.is_active && state_.is_active &&
      frame.device.became_active_at > state_.became_active_at) {
    logger_.Info("device " + frame.ident + " (" + frame.device.name +
                 ") became active, releasing playback");
    state_.is_active = false;
    state_.status = PlayStatus::kStop;
    actions->push_back(StopPlaybackAction{});
    Notify(std::nullopt, actions);
  }

  switch (frame.type) {
    case MessageType::kHello:
      Notify(frame.ident, actions);
      break;

    case MessageType::kVolume: {
      const uint32_t volume = frame.volume.value_or(0);
      state_.volume = static_cast<uint16_t>(
          std::min<uint32_t>(volume, kVolumeMax));
      Notify(std::nullopt, actions);
      break;
    }

    case MessageType::kLoad: {
      const int64_t now = Now();
      AdvanceUpdateId(now);
      if (!state_.is_active) {
        state_.is_active = true;
        state_.became_active_at = now;
      }
      state_.LoadTracks(frame.state.value_or(PlaybackSnapshot{}));
      LoadCurrentTrack(now, actions);
      Notify(std::nullopt, actions);
      break;
    }

    default:
      break;
  }
}

void Controller::HandlePlayerEvent(const PlayerEvent& event, Actions* actions) {
  switch (event.type) {
    case PlayerEventType::kTrackEnded: {
      // A track end queued before a handoff must not restart playback here.
      if (!state_.is_active) {
        logger_.Debug("ignoring track end while inactive");
        return;
      }
      if (state_.tracks.empty()) {
        logger_.Warn("track ended with an empty track list");
        state_.status = PlayStatus::kStop;
        return;
      }
      const auto count = static_cast<uint32_t>(state_.tracks.size());
      state_.index = (state_.index + 1) % count;
      const int64_t now = Now();
      actions->push_back(LoadTrackAction{state_.tracks[state_.index]});
      AdvanceUpdateId(now);
      state_.position_ms = 0;
      state_.position_measured_at = static_cast<uint64_t>(now);
      Notify(std::nullopt, actions);
      return;
    }
    case PlayerEventType::kPositionUpdate:
      state_.position_ms = event.position_ms;
      state_.position_measured_at = static_cast<uint64_t>(Now());
      return;
  }
}

void Controller::HandleSendCompletion(const SendCompletion& completion) {
  if (completion.ok) {
    if (logger_.Enabled(LogLevel::kTrace)) {
      std::ostringstream oss;
      oss << "sent " << MessageTypeName(completion.type)
          << " seq=" << completion.seq_nr;
      logger_.Trace(oss.str());
    }
    return;
  }
  std::ostringstream oss;
  oss << "dropped " << MessageTypeName(completion.type)
      << " seq=" << completion.seq_nr << ": " << completion.error;
  logger_.Warn(oss.str());
}

void Controller::LoadCurrentTrack(int64_t now, Actions* actions) {
  if (!state_.HasCurrentTrack()) {
    // No track to play: an empty or out-of-range list leaves playback stopped.
    if (state_.status != PlayStatus::kStop) {
      actions->push_back(StopPlaybackAction{});
    }
    state_.status = PlayStatus::kStop;
    state_.position_ms = 0;
    return;
  }
  actions->push_back(LoadTrackAction{state_.tracks[state_.index]});
  state_.status = PlayStatus::kPlay;
  state_.position_ms = 0;
  state_.position_measured_at = static_cast<uint64_t>(now);
}

void Controller::AdvanceUpdateId(int64_t now) {
  if (now > state_.update_id) {
    state_.update_id = now;
  }
}

uint32_t Controller::NextSeq() {
  seq_nr_ += 1;
  return seq_nr_;
}

void Controller::Command(MessageType type,
                         std::optional<std::string> recipient,
                         std::optional<PlaybackSnapshot> state,
                         Actions* actions) {
  FrameFields fields;
  fields.type = type;
  fields.ident = ident_;
  fields.seq_nr = NextSeq();
  fields.device = state_.Descriptor(sw_version_);
  fields.recipient = std::move(recipient);
  if (state.has_value()) {
    fields.state = std::move(state);
    fields.state_update_id = state_.update_id;
  }
  SendFrame(BuildFrame(std::move(fields)), actions);
}

void Controller::SendFrame(Envelope frame, Actions* actions) {
  if (!connected_) {
    ++dropped_frames_;
    logger_.Warn(std::string("not connected, dropping ") +
                 MessageTypeName(frame.type) + " frame");
    return;
  }
  actions->push_back(SendFrameAction{std::move(frame)});
}

void Controller::Notify(std::optional<std::string> recipient, Actions* actions) {
  Command(MessageType::kNotify, std::move(recipient), state_.Snapshot(), actions);
}

int64_t Controller::Now() const {
  return clock_ ? clock_() : SystemTimeMs();
}

}  // namespace spirc
