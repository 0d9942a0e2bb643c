// Tests for UDP datagram framing and capture replay.
#include "spirc/test_hooks.h"
#include "spirc/udp_channel.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace {

void WriteRecord(std::ofstream& out, uint64_t timestamp_us, const std::string& payload) {
  const uint32_t length = static_cast<uint32_t>(payload.size());
  out.write(reinterpret_cast<const char*>(&timestamp_us), sizeof(timestamp_us));
  out.write(reinterpret_cast<const char*>(&length), sizeof(length));
  out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
}

std::string TempPath(const std::string& name) {
  return ::testing::TempDir() + name;
}

}  // namespace

TEST(DatagramTest, HeaderTopicAndPayloadLayout) {
  const auto packet = spirc::test::BuildDatagram("hm://remote/user/a", "xyz");
  ASSERT_EQ(packet.size(), 10u + 2u + 18u + 4u + 3u);
  EXPECT_EQ(std::string(packet.begin(), packet.begin() + 10), "SpircLink1");
  EXPECT_EQ(packet[10], 0x00);
  EXPECT_EQ(packet[11], 18);
  EXPECT_EQ(packet[30], 0x00);
  EXPECT_EQ(packet[33], 3);
  EXPECT_EQ(std::string(packet.end() - 3, packet.end()), "xyz");
}

TEST(DatagramTest, ParseRecoversTopicAndPayload) {
  const std::string payload("\x00\x01\x02", 3);
  const auto packet = spirc::test::BuildDatagram("hm://remote/user/bob", payload);
  std::string topic;
  std::string body;
  ASSERT_TRUE(spirc::test::ParseDatagram(packet, &topic, &body));
  EXPECT_EQ(topic, "hm://remote/user/bob");
  EXPECT_EQ(body, payload);
}

TEST(DatagramTest, RejectsForeignHeader) {
  auto packet = spirc::test::BuildDatagram("t", "p");
  packet[0] = 'Q';
  std::string topic;
  std::string body;
  EXPECT_FALSE(spirc::test::ParseDatagram(packet, &topic, &body));
}

TEST(DatagramTest, RejectsTruncatedPacket) {
  auto packet = spirc::test::BuildDatagram("topic", "payload");
  packet.pop_back();
  std::string topic;
  std::string body;
  EXPECT_FALSE(spirc::test::ParseDatagram(packet, &topic, &body));

  const std::vector<uint8_t> tiny = {0x53, 0x70};
  EXPECT_FALSE(spirc::test::ParseDatagram(tiny, &topic, &body));
}

TEST(ReplayChannelTest, YieldsCapturedPayloadsInOrder) {
  const std::string path = TempPath("spirc_replay_order.bin");
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    WriteRecord(out, 1000, "first");
    WriteRecord(out, 1000, "second");
  }

  spirc::UdpChannelConfig config;
  config.replay_file = path;
  spirc::UdpMessageChannel channel(config);
  std::string error;
  auto subscription = channel.Subscribe("hm://remote/user/a", &error);
  ASSERT_NE(subscription, nullptr) << error;

  std::string payload;
  ASSERT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kReady);
  EXPECT_EQ(payload, "first");
  ASSERT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kReady);
  EXPECT_EQ(payload, "second");
  EXPECT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kError);
  EXPECT_EQ(error, "replay file exhausted");
  std::remove(path.c_str());
}

TEST(ReplayChannelTest, PacesByRecordedTimestamps) {
  const std::string path = TempPath("spirc_replay_pacing.bin");
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    WriteRecord(out, 0, "now");
    WriteRecord(out, 50000, "later");
  }

  spirc::UdpChannelConfig config;
  config.replay_file = path;
  spirc::UdpMessageChannel channel(config);
  std::string error;
  auto subscription = channel.Subscribe("t", &error);
  ASSERT_NE(subscription, nullptr) << error;

  std::string payload;
  ASSERT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kReady);
  EXPECT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kPending);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  ASSERT_EQ(subscription->Poll(&payload, &error), spirc::PollResult::kReady);
  EXPECT_EQ(payload, "later");
  std::remove(path.c_str());
}

TEST(ReplayChannelTest, MissingFileFailsSubscribe) {
  spirc::UdpChannelConfig config;
  config.replay_file = TempPath("spirc_does_not_exist.bin");
  spirc::UdpMessageChannel channel(config);
  std::string error;
  EXPECT_EQ(channel.Subscribe("t", &error), nullptr);
  EXPECT_NE(error.find("replay file"), std::string::npos);
}

TEST(UdpChannelTest, InvalidConfigFailsBothHandles) {
  spirc::UdpChannelConfig config;
  config.broadcast_address = "bogus";
  spirc::UdpMessageChannel channel(config);
  std::string error;
  EXPECT_EQ(channel.Subscribe("t", &error), nullptr);
  EXPECT_NE(error.find("broadcast_address"), std::string::npos);
  error.clear();
  EXPECT_EQ(channel.CreatePublisher("t", &error), nullptr);
  EXPECT_NE(error.find("broadcast_address"), std::string::npos);
}
