#pragma once

#include "spirc/collaborators.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spirc {

#ifdef SPIRC_TESTING
namespace test {
std::vector<uint8_t> BuildDatagram(const std::string& topic,
                                   const std::string& payload);
bool ParseDatagram(const std::vector<uint8_t>& data, std::string* topic,
                   std::string* payload);
}  // namespace test
#endif

/// Default UDP port shared by all endpoints on the LAN.
constexpr uint16_t kDefaultChannelPort = 57621;

/**
 * LAN transport configuration.
 */
struct UdpChannelConfig {
  /// Local bind address for the subscription socket (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Broadcast address frames are published to.
  std::string broadcast_address = "255.255.255.255";
  /// Port used for both publishing and subscribing.
  uint16_t port = kDefaultChannelPort;

  /// Optional capture file receiving every inbound payload (binary).
  std::string capture_file;
  /// Optional replay file used instead of the network for inbound payloads.
  std::string replay_file;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Message channel over UDP broadcast.
 *
 * Each datagram carries a magic header, the topic and one serialized
 * envelope. Subscriptions only yield payloads whose topic matches.
 */
class UdpMessageChannel : public MessageChannel {
 public:
  explicit UdpMessageChannel(UdpChannelConfig config);
  ~UdpMessageChannel() override;

  UdpMessageChannel(const UdpMessageChannel&) = delete;
  UdpMessageChannel& operator=(const UdpMessageChannel&) = delete;

  std::unique_ptr<Subscription> Subscribe(const std::string& topic,
                                          std::string* error) override;
  std::unique_ptr<Publisher> CreatePublisher(const std::string& topic,
                                             std::string* error) override;

 private:
  UdpChannelConfig config_;
};

}  // namespace spirc
