// Tests for the protobuf envelope codec.
#include "spirc/codec.h"
#include "spirc/controller.h"

#include "spirc.pb.h"

#include <gtest/gtest.h>

#include <string>

namespace {

spirc::Envelope SampleNotify() {
  spirc::PlaybackState state("Study");
  state.is_active = true;
  state.became_active_at = 1700000000000;
  state.status = spirc::PlayStatus::kPlay;
  state.volume = 4000;
  state.position_ms = 65000;
  state.position_measured_at = 1700000001000;
  state.index = 0;
  spirc::TrackId id{};
  id.fill(0x5a);
  state.tracks = {id};
  state.update_id = 1700000000500;

  spirc::FrameFields fields;
  fields.type = spirc::MessageType::kNotify;
  fields.ident = "study-endpoint";
  fields.seq_nr = 12;
  fields.device = state.Descriptor("test-1.0");
  fields.recipient = std::string("kitchen-endpoint");
  fields.state = state.Snapshot();
  fields.state_update_id = state.update_id;
  return spirc::BuildFrame(fields);
}

}  // namespace

TEST(CodecTest, NotifySurvivesEncodeDecode) {
  const auto original = SampleNotify();
  std::string bytes;
  std::string error;
  ASSERT_TRUE(spirc::EncodeEnvelope(original, &bytes, &error)) << error;

  spirc::Envelope decoded;
  ASSERT_TRUE(spirc::DecodeEnvelope(bytes, &decoded, &error)) << error;
  EXPECT_EQ(decoded.type, spirc::MessageType::kNotify);
  EXPECT_EQ(decoded.ident, "study-endpoint");
  EXPECT_EQ(decoded.seq_nr, 12u);
  EXPECT_EQ(decoded.recipients, original.recipients);
  EXPECT_EQ(decoded.state_update_id, 1700000000500);

  EXPECT_EQ(decoded.device.name, "Study");
  EXPECT_EQ(decoded.device.sw_version, "test-1.0");
  EXPECT_TRUE(decoded.device.is_active);
  EXPECT_EQ(decoded.device.volume, 4000);
  EXPECT_EQ(decoded.device.became_active_at, 1700000000000);
  ASSERT_EQ(decoded.device.capabilities.size(), original.device.capabilities.size());
  EXPECT_EQ(decoded.device.capabilities.back().string_values,
            original.device.capabilities.back().string_values);

  ASSERT_TRUE(decoded.state.has_value());
  EXPECT_EQ(decoded.state->status, spirc::PlayStatus::kPlay);
  EXPECT_EQ(decoded.state->position_ms, 65000u);
  EXPECT_EQ(decoded.state->position_measured_at, 1700000001000u);
  ASSERT_EQ(decoded.state->tracks.size(), 1u);
  EXPECT_EQ(decoded.state->tracks[0].gid, original.state->tracks[0].gid);
  EXPECT_FALSE(decoded.volume.has_value());
}

TEST(CodecTest, StampsProtocolVersion) {
  std::string bytes;
  ASSERT_TRUE(spirc::EncodeEnvelope(SampleNotify(), &bytes));
  spirc::protocol::Frame frame;
  ASSERT_TRUE(frame.ParseFromString(bytes));
  EXPECT_EQ(frame.version(), 1u);
  EXPECT_EQ(frame.protocol_version(), "2.0.0");
  EXPECT_EQ(frame.typ(), spirc::protocol::kMessageTypeNotify);
}

TEST(CodecTest, VolumeCommandCarriesValue) {
  spirc::Envelope volume;
  volume.type = spirc::MessageType::kVolume;
  volume.ident = "remote";
  volume.volume = 30000;
  std::string bytes;
  ASSERT_TRUE(spirc::EncodeEnvelope(volume, &bytes));

  spirc::Envelope decoded;
  ASSERT_TRUE(spirc::DecodeEnvelope(bytes, &decoded));
  ASSERT_TRUE(decoded.volume.has_value());
  EXPECT_EQ(decoded.volume.value(), 30000u);
  EXPECT_FALSE(decoded.state.has_value());
}

TEST(CodecTest, RejectsGarbage) {
  spirc::Envelope decoded;
  std::string error;
  EXPECT_FALSE(spirc::DecodeEnvelope(std::string("\xff\xff\xff\xff", 4), &decoded, &error));
  EXPECT_NE(error.find("malformed frame"), std::string::npos);
}

TEST(CodecTest, RejectsFrameWithoutIdent) {
  spirc::protocol::Frame frame;
  frame.set_typ(spirc::protocol::kMessageTypeHello);
  std::string bytes;
  ASSERT_TRUE(frame.SerializePartialToString(&bytes));

  spirc::Envelope decoded;
  std::string error;
  EXPECT_FALSE(spirc::DecodeEnvelope(bytes, &decoded, &error));
  EXPECT_NE(error.find("ident"), std::string::npos);
}

TEST(CodecTest, RejectsFrameWithoutType) {
  spirc::protocol::Frame frame;
  frame.set_ident("peer");
  std::string bytes;
  ASSERT_TRUE(frame.SerializePartialToString(&bytes));

  spirc::Envelope decoded;
  std::string error;
  EXPECT_FALSE(spirc::DecodeEnvelope(bytes, &decoded, &error));
  EXPECT_NE(error.find("typ"), std::string::npos);
}

TEST(CodecTest, ShortGidDecodesWithoutId) {
  spirc::protocol::Frame frame;
  frame.set_ident("peer");
  frame.set_typ(spirc::protocol::kMessageTypeLoad);
  auto* good = frame.mutable_state()->add_track();
  good->set_gid(std::string(16, '\x01'));
  auto* short_ref = frame.mutable_state()->add_track();
  short_ref->set_gid(std::string(15, '\x02'));
  short_ref->set_uri("spotify:track:short");
  std::string bytes;
  ASSERT_TRUE(frame.SerializeToString(&bytes));

  spirc::Envelope decoded;
  ASSERT_TRUE(spirc::DecodeEnvelope(bytes, &decoded));
  ASSERT_TRUE(decoded.state.has_value());
  ASSERT_EQ(decoded.state->tracks.size(), 2u);
  EXPECT_TRUE(decoded.state->tracks[0].gid.has_value());
  EXPECT_FALSE(decoded.state->tracks[1].gid.has_value());
  EXPECT_EQ(decoded.state->tracks[1].uri, "spotify:track:short");
}

TEST(CodecTest, IgnoresUnknownFields) {
  spirc::protocol::Frame frame;
  frame.set_ident("peer");
  frame.set_typ(spirc::protocol::kMessageTypeHello);
  std::string bytes;
  ASSERT_TRUE(frame.SerializeToString(&bytes));
  // Field 100, varint 1.
  bytes.push_back(static_cast<char>(0xa0));
  bytes.push_back(static_cast<char>(0x06));
  bytes.push_back(static_cast<char>(0x01));

  spirc::Envelope decoded;
  ASSERT_TRUE(spirc::DecodeEnvelope(bytes, &decoded));
  EXPECT_EQ(decoded.type, spirc::MessageType::kHello);
  EXPECT_EQ(decoded.ident, "peer");
}

TEST(CodecTest, NullOutputIsAnError) {
  std::string error;
  EXPECT_FALSE(spirc::EncodeEnvelope(SampleNotify(), nullptr, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(spirc::DecodeEnvelope("", nullptr, &error));
}
