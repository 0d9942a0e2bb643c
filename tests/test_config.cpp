// Tests for configuration validation.
#include "spirc/spirc.h"
#include "spirc/udp_channel.h"

#include <gtest/gtest.h>

namespace {

spirc::Config ValidConfig() {
  spirc::Config config;
  config.device_id = "device-1";
  return config;
}

}  // namespace

TEST(ConfigValidationTest, AcceptsDefaultsWithDeviceId) {
  std::string error;
  EXPECT_TRUE(ValidConfig().Validate(&error));
  EXPECT_TRUE(error.empty());
}

TEST(ConfigValidationTest, RejectsMissingDeviceId) {
  spirc::Config config;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("device_id"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsEmptyDeviceName) {
  auto config = ValidConfig();
  config.device_name.clear();
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("device_name"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsNonPositiveIdleWait) {
  auto config = ValidConfig();
  config.idle_wait = std::chrono::milliseconds(0);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("idle_wait"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsEmptyOutboundQueue) {
  auto config = ValidConfig();
  config.max_pending_frames = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_pending_frames"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsNegativeRetries) {
  auto config = ValidConfig();
  config.send_max_retries = -1;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("send_max_retries"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsNegativeRetryBackoff) {
  auto config = ValidConfig();
  config.send_retry_backoff = std::chrono::milliseconds(-1);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("send_retry_backoff"), std::string::npos);
}

TEST(ConfigValidationTest, NullErrorPointerIsAllowed) {
  spirc::Config config;
  EXPECT_FALSE(config.Validate());
}

TEST(ChannelConfigValidationTest, AcceptsDefaults) {
  spirc::UdpChannelConfig config;
  EXPECT_TRUE(config.Validate());
  EXPECT_EQ(config.port, spirc::kDefaultChannelPort);
}

TEST(ChannelConfigValidationTest, RejectsZeroPort) {
  spirc::UdpChannelConfig config;
  config.port = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("port"), std::string::npos);
}

TEST(ChannelConfigValidationTest, RejectsInvalidBindAddress) {
  spirc::UdpChannelConfig config;
  config.bind_address = "999.1.1.1";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("bind_address"), std::string::npos);
}

TEST(ChannelConfigValidationTest, RejectsInvalidBroadcastAddress) {
  spirc::UdpChannelConfig config;
  config.broadcast_address = "not-an-ip";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("broadcast_address"), std::string::npos);
}

TEST(ChannelConfigValidationTest, RejectsCaptureWithReplay) {
  spirc::UdpChannelConfig config;
  config.capture_file = "in.bin";
  config.replay_file = "out.bin";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("mutually exclusive"), std::string::npos);
}
