#include "spirc/codec.h"

#include "spirc.pb.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace spirc {
namespace {

constexpr uint32_t kFrameVersion = 1;
constexpr const char* kProtocolVersion = "2.0.0";

void Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

void EncodeDevice(const DeviceDescriptor& device, protocol::DeviceState* out) {
  out->set_sw_version(device.sw_version);
  out->set_is_active(device.is_active);
  out->set_can_play(device.can_play);
  out->set_volume(device.volume);
  out->set_name(device.name);
  out->set_error_code(device.error_code);
  out->set_became_active_at(device.became_active_at);
  for (const auto& capability : device.capabilities) {
    auto* cap = out->add_capabilities();
    cap->set_typ(static_cast<protocol::CapabilityType>(capability.type));
    for (const int64_t value : capability.int_values) {
      cap->add_intvalue(value);
    }
    for (const auto& value : capability.string_values) {
      cap->add_stringvalue(value);
    }
  }
}

void DecodeDevice(const protocol::DeviceState& in, DeviceDescriptor* out) {
  out->sw_version = in.sw_version();
  out->is_active = in.is_active();
  out->can_play = in.can_play();
  out->volume = static_cast<uint16_t>(
      std::min<uint32_t>(in.volume(), kVolumeMax));
  out->name = in.name();
  out->error_code = in.error_code();
  out->became_active_at = in.became_active_at();
  out->capabilities.clear();
  out->capabilities.reserve(in.capabilities_size());
  for (const auto& cap : in.capabilities()) {
    Capability capability;
    capability.type = static_cast<CapabilityType>(cap.typ());
    capability.int_values.assign(cap.intvalue().begin(), cap.intvalue().end());
    capability.string_values.assign(cap.stringvalue().begin(),
                                    cap.stringvalue().end());
    out->capabilities.push_back(std::move(capability));
  }
}

void EncodeState(const PlaybackSnapshot& state, protocol::State* out) {
  out->set_status(static_cast<protocol::PlayStatus>(state.status));
  out->set_position_ms(state.position_ms);
  out->set_position_measured_at(state.position_measured_at);
  out->set_playing_track_index(state.playing_track_index);
  out->set_playing_from_fallback(state.playing_from_fallback);
  for (const auto& track : state.tracks) {
    auto* ref = out->add_track();
    if (track.gid.has_value()) {
      ref->set_gid(std::string(reinterpret_cast<const char*>(track.gid->data()),
                               track.gid->size()));
    }
    if (!track.uri.empty()) {
      ref->set_uri(track.uri);
    }
  }
}

void DecodeState(const protocol::State& in, PlaybackSnapshot* out) {
  out->status = static_cast<PlayStatus>(in.status());
  out->position_ms = in.position_ms();
  out->position_measured_at = in.position_measured_at();
  out->playing_track_index = in.playing_track_index();
  out->playing_from_fallback = in.playing_from_fallback();
  out->tracks.clear();
  out->tracks.reserve(in.track_size());
  for (const auto& ref : in.track()) {
    TrackRef track;
    if (ref.has_gid() && ref.gid().size() == kTrackIdLength) {
      TrackId id{};
      std::memcpy(id.data(), ref.gid().data(), id.size());
      track.gid = id;
    }
    track.uri = ref.uri();
    out->tracks.push_back(std::move(track));
  }
}

}  // namespace

bool EncodeEnvelope(const Envelope& envelope, std::string* out,
                    std::string* error) {
  if (!out) {
    Fail(error, "output buffer is null");
    return false;
  }
  protocol::Frame frame;
  frame.set_version(kFrameVersion);
  frame.set_ident(envelope.ident);
  frame.set_protocol_version(kProtocolVersion);
  frame.set_seq_nr(envelope.seq_nr);
  frame.set_typ(static_cast<protocol::MessageType>(envelope.type));
  EncodeDevice(envelope.device, frame.mutable_device_state());
  if (envelope.state.has_value()) {
    EncodeState(envelope.state.value(), frame.mutable_state());
  }
  if (envelope.volume.has_value()) {
    frame.set_volume(envelope.volume.value());
  }
  if (envelope.position.has_value()) {
    frame.set_position(envelope.position.value());
  }
  frame.set_state_update_id(envelope.state_update_id);
  for (const auto& recipient : envelope.recipients) {
    frame.add_recipient(recipient);
  }
  if (!frame.SerializeToString(out)) {
    Fail(error, std::string("failed to serialize ") +
                    MessageTypeName(envelope.type) + " frame");
    return false;
  }
  return true;
}

bool DecodeEnvelope(const std::string& data, Envelope* out, std::string* error) {
  if (!out) {
    Fail(error, "output envelope is null");
    return false;
  }
  protocol::Frame frame;
  if (!frame.ParseFromString(data)) {
    const std::string missing = frame.InitializationErrorString();
    Fail(error, missing.empty() ? "malformed frame"
                                : "malformed frame, missing: " + missing);
    return false;
  }
  Envelope envelope;
  envelope.type = static_cast<MessageType>(frame.typ());
  envelope.ident = frame.ident();
  envelope.recipients.assign(frame.recipient().begin(), frame.recipient().end());
  envelope.seq_nr = frame.seq_nr();
  envelope.state_update_id = frame.state_update_id();
  DecodeDevice(frame.device_state(), &envelope.device);
  if (frame.has_state()) {
    PlaybackSnapshot state;
    DecodeState(frame.state(), &state);
    envelope.state = std::move(state);
  }
  if (frame.has_volume()) {
    envelope.volume = frame.volume();
  }
  if (frame.has_position()) {
    envelope.position = frame.position();
  }
  *out = std::move(envelope);
  return true;
}

}  // namespace spirc
