// Example: run a remote-controllable playback endpoint on the LAN.
#include "spirc/spirc.h"
#include "spirc/event_queue.h"
#include "spirc/udp_channel.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace {

// Pretends to play each loaded track for a fixed duration.
class SimulatedPlayer : public spirc::Player {
 public:
  explicit SimulatedPlayer(uint32_t track_length_ms)
      : track_length_ms_(track_length_ms), worker_([this]() { Run(); }) {}

  ~SimulatedPlayer() override {
    running_ = false;
    worker_.join();
  }

  void Load(const spirc::TrackId& track) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "Player: loading " << spirc::TrackIdToHex(track) << std::endl;
    playing_ = true;
    position_ms_ = 0;
  }

  void Stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "Player: stopped" << std::endl;
    playing_ = false;
  }

  spirc::PollResult PollEvent(spirc::PlayerEvent* out, std::string* error) override {
    return events_.Poll(out, error);
  }

  int fd() const override { return events_.fd(); }

 private:
  void Run() {
    constexpr uint32_t kStepMs = 1000;
    while (running_) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kStepMs));
      std::lock_guard<std::mutex> lock(mutex_);
      if (!playing_) {
        continue;
      }
      position_ms_ += kStepMs;
      if (position_ms_ >= track_length_ms_) {
        playing_ = false;
        events_.Push(spirc::PlayerEvent{spirc::PlayerEventType::kTrackEnded, 0});
      } else {
        events_.Push(spirc::PlayerEvent{spirc::PlayerEventType::kPositionUpdate,
                                        position_ms_});
      }
    }
  }

  const uint32_t track_length_ms_;
  std::mutex mutex_;
  bool playing_ = false;
  uint32_t position_ms_ = 0;
  spirc::EventQueue<spirc::PlayerEvent> events_;
  std::atomic<bool> running_{true};
  std::thread worker_;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cout << "Usage: spirc_device <username> <device_id> [name] [broadcast_ip] "
                 "[--capture file | --replay file] [--verbose]\n";
    return 1;
  }

  const std::string username = argv[1];
  spirc::Config config;
  config.device_id = argv[2];

  spirc::UdpChannelConfig channel_config;
  bool have_name = false;
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose") {
      config.log_level = spirc::LogLevel::kTrace;
    } else if (arg == "--capture" && i + 1 < argc) {
      channel_config.capture_file = argv[++i];
    } else if (arg == "--replay" && i + 1 < argc) {
      channel_config.replay_file = argv[++i];
    } else if (!have_name) {
      config.device_name = arg;
      have_name = true;
    } else {
      channel_config.broadcast_address = arg;
    }
  }

  std::string error;
  if (!channel_config.Validate(&error)) {
    std::cerr << "Invalid channel configuration: " << error << std::endl;
    return 1;
  }

  spirc::UdpMessageChannel channel(channel_config);
  spirc::ConnectionQueue connections;
  SimulatedPlayer player(30000);

  spirc::Session session(config, channel, connections, player);
  session.SetFrameCallback([](const spirc::Envelope& frame) {
    std::cout << spirc::MessageTypeName(frame.type) << " from " << frame.device.name
              << " (" << frame.ident << ")" << std::endl;
  });
  connections.Connected(username);

  if (!session.Start()) {
    std::cerr << "Failed to start session: " << session.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Device \"" << config.device_name << "\" running. Press Enter to stop."
            << std::endl;
  std::string line;
  std::getline(std::cin, line);
  session.Stop();
  if (!session.GetLastError().empty()) {
    std::cerr << "Session stopped: " << session.GetLastError() << std::endl;
    return 1;
  }
  return 0;
}
