// Example: send a Load (or Volume) command and print the Notify replies.
#include "spirc/spirc.h"
#include "spirc/codec.h"
#include "spirc/controller.h"
#include "spirc/udp_channel.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kRemoteIdent = "spirc-remote";

const char* StatusName(spirc::PlayStatus status) {
  switch (status) {
    case spirc::PlayStatus::kStop: return "stop";
    case spirc::PlayStatus::kPlay: return "play";
    case spirc::PlayStatus::kPause: return "pause";
    case spirc::PlayStatus::kLoading: return "loading";
  }
  return "unknown";
}

void PrintNotify(const spirc::Envelope& frame) {
  std::cout << "Notify from " << frame.device.name << " (" << frame.ident << ")"
            << " active=" << (frame.device.is_active ? "y" : "n")
            << " volume=" << frame.device.volume
            << " update=" << frame.state_update_id;
  if (frame.state.has_value()) {
    const auto& state = frame.state.value();
    std::cout << " status=" << StatusName(state.status)
              << " track=" << state.playing_track_index << "/" << state.tracks.size()
              << " pos=" << state.position_ms << "ms";
  }
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cout << "Usage: spirc_remote <username> <track_hex>... [--volume N] "
                 "[--broadcast ip] [--listen seconds]\n";
    return 1;
  }

  const std::string username = argv[1];
  spirc::UdpChannelConfig channel_config;
  spirc::PlaybackSnapshot snapshot;
  int volume = -1;
  int listen_seconds = 5;

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--volume" && i + 1 < argc) {
      volume = std::atoi(argv[++i]);
    } else if (arg == "--broadcast" && i + 1 < argc) {
      channel_config.broadcast_address = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      listen_seconds = std::atoi(argv[++i]);
    } else {
      spirc::TrackId id{};
      if (!spirc::TrackIdFromHex(arg, &id)) {
        std::cerr << "Invalid track id: " << arg << std::endl;
        return 1;
      }
      spirc::TrackRef ref;
      ref.gid = id;
      snapshot.tracks.push_back(ref);
    }
  }

  spirc::UdpMessageChannel channel(channel_config);
  const std::string topic = spirc::TopicForUser(username);
  std::string error;
  auto subscription = channel.Subscribe(topic, &error);
  if (!subscription) {
    std::cerr << "Failed to subscribe: " << error << std::endl;
    return 1;
  }
  auto publisher = channel.CreatePublisher(topic, &error);
  if (!publisher) {
    std::cerr << "Failed to create publisher: " << error << std::endl;
    return 1;
  }

  spirc::PlaybackState remote_state("spirc remote");
  spirc::FrameFields fields;
  fields.ident = kRemoteIdent;
  fields.seq_nr = 1;
  fields.device = remote_state.Descriptor(spirc::kDefaultSwVersion);
  fields.device.can_play = false;
  if (volume >= 0) {
    fields.type = spirc::MessageType::kVolume;
  } else {
    fields.type = spirc::MessageType::kLoad;
    fields.state = snapshot;
  }
  spirc::Envelope command = spirc::BuildFrame(fields);
  if (volume >= 0) {
    command.volume = static_cast<uint32_t>(volume);
  }

  std::string payload;
  if (!spirc::EncodeEnvelope(command, &payload, &error)) {
    std::cerr << "Failed to encode command: " << error << std::endl;
    return 1;
  }
  if (publisher->Send(payload, &error) != spirc::SendResult::kSent) {
    std::cerr << "Failed to send command: " << error << std::endl;
    return 1;
  }
  std::cout << "Sent " << spirc::MessageTypeName(command.type) << " to " << topic
            << std::endl;

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(listen_seconds);
  while (std::chrono::steady_clock::now() < deadline) {
    std::string inbound;
    const auto result = subscription->Poll(&inbound, &error);
    if (result == spirc::PollResult::kError) {
      std::cerr << "Receive failed: " << error << std::endl;
      return 1;
    }
    if (result == spirc::PollResult::kPending) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      continue;
    }
    spirc::Envelope frame;
    if (!spirc::DecodeEnvelope(inbound, &frame, &error)) {
      std::cerr << "Ignoring undecodable frame: " << error << std::endl;
      continue;
    }
    if (frame.type == spirc::MessageType::kNotify &&
        spirc::ShouldDispatch(frame, kRemoteIdent)) {
      PrintNotify(frame);
    }
  }
  return 0;
}
