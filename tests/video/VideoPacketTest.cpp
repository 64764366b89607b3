// Repository: PeerLink
// Component: VideoPacket Tests
// Purpose: Packetization, header parsing and frame reassembly.
// Copyright (c) 2026 PeerLink

#include "peerlink/video/VideoPacket.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "peerlink/video/TestPatternCapture.hpp"
#include "peerlink/video/VideoPlayback.hpp"

namespace peerlink::video::testing {
namespace {

std::vector<uint8_t> Picture(size_t size, uint8_t seed) {
  std::vector<uint8_t> out(size);
  for (size_t i = 0; i < size; ++i) out[i] = static_cast<uint8_t>(seed + i);
  return out;
}

TEST(VideoPacketTest, PacketizeSplitsAndNumbers) {
  const auto picture = Picture(25, 1);
  const auto packets = Packetize(7, picture, kPacketHeaderBytes + 10);
  ASSERT_EQ(packets.size(), 3u);

  std::string error;
  for (size_t i = 0; i < packets.size(); ++i) {
    const auto header = ParseHeader(packets[i], &error);
    ASSERT_TRUE(header.has_value()) << error;
    EXPECT_EQ(header->frame_id, 7u);
    EXPECT_EQ(header->index, i);
    EXPECT_EQ(header->count, 3);
  }
  EXPECT_EQ(packets.back().size(), kPacketHeaderBytes + 5);
}

TEST(VideoPacketTest, PacketizeRejectsPacketsWithoutPayloadRoom) {
  EXPECT_THROW(Packetize(0, Picture(4, 0), kPacketHeaderBytes), std::invalid_argument);
}

TEST(VideoPacketTest, ParseHeaderRejectsShortAndInconsistentPackets) {
  std::string error;
  EXPECT_FALSE(ParseHeader(core::Frame(std::vector<uint8_t>{1, 2, 3}), &error).has_value());
  EXPECT_NE(error.find("shorter than header"), std::string::npos);

  // index 2 of count 2
  const core::Frame bad(std::vector<uint8_t>{0, 0, 0, 1, 0, 2, 0, 2});
  EXPECT_FALSE(ParseHeader(bad, &error).has_value());
  EXPECT_NE(error.find("outside count"), std::string::npos);
}

TEST(FrameAssemblerTest, ReassemblesOutOfOrderPacketsAndIgnoresDuplicates) {
  const auto picture = Picture(30, 9);
  auto packets = Packetize(1, picture, kPacketHeaderBytes + 10);
  ASSERT_EQ(packets.size(), 3u);

  FrameAssembler assembler;
  std::string error;
  EXPECT_FALSE(assembler.Push(packets[2], &error).has_value());
  EXPECT_FALSE(assembler.Push(packets[2], &error).has_value());
  EXPECT_FALSE(assembler.Push(packets[0], &error).has_value());
  const auto done = assembler.Push(packets[1], &error);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(*done, picture);
  EXPECT_TRUE(error.empty());
  EXPECT_EQ(assembler.frames_completed(), 1u);
}

TEST(FrameAssemblerTest, NewerFrameDropsThePartialOne) {
  const auto first = Packetize(1, Picture(20, 0), kPacketHeaderBytes + 10);
  const auto second = Packetize(2, Picture(20, 50), kPacketHeaderBytes + 10);

  FrameAssembler assembler;
  std::string error;
  EXPECT_FALSE(assembler.Push(first[0], &error).has_value());
  EXPECT_FALSE(assembler.Push(second[0], &error).has_value());
  EXPECT_EQ(assembler.frames_dropped(), 1u);

  // The rest of frame 1 is now stale.
  EXPECT_FALSE(assembler.Push(first[1], &error).has_value());
  EXPECT_EQ(assembler.stale_packets(), 1u);

  const auto done = assembler.Push(second[1], &error);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(*done, Picture(20, 50));
}

TEST(FrameAssemblerTest, PacketsOfCompletedFramesAreStale) {
  const auto packets = Packetize(5, Picture(5, 0), kPacketHeaderBytes + 10);
  ASSERT_EQ(packets.size(), 1u);

  FrameAssembler assembler;
  std::string error;
  ASSERT_TRUE(assembler.Push(packets[0], &error).has_value());
  EXPECT_FALSE(assembler.Push(packets[0], &error).has_value());
  EXPECT_EQ(assembler.stale_packets(), 1u);
  EXPECT_EQ(assembler.frames_completed(), 1u);
}

TEST(FrameAssemblerTest, FrameIdsWrapAround) {
  FrameAssembler assembler;
  std::string error;
  ASSERT_TRUE(
      assembler.Push(Packetize(0xFFFFFFFFu, Picture(4, 0), 64)[0], &error).has_value());
  EXPECT_TRUE(assembler.Push(Packetize(0, Picture(4, 1), 64)[0], &error).has_value());
  EXPECT_EQ(assembler.stale_packets(), 0u);
}

TEST(TestPatternTest, PacketsPerFrameCoversThePicture) {
  config::MediaConfig media;
  media.video_width = 320;
  media.video_height = 180;
  EXPECT_EQ(PacketsPerFrame(media, 1200), 49u);

  media.video_width = 16;
  media.video_height = 4;
  EXPECT_EQ(PacketsPerFrame(media, kPacketHeaderBytes + 64), 1u);
  EXPECT_EQ(RenderTestPattern(16, 4, 0).size(), 64u);
}

TEST(VideoPlaybackTest, CountsCompletedFrames) {
  VideoPlayback playback;
  std::string error;
  ASSERT_TRUE(playback.Open(&error)) << error;

  for (uint32_t id = 0; id < 3; ++id) {
    for (const auto& packet : Packetize(id, RenderTestPattern(32, 8, id), 108)) {
      ASSERT_TRUE(playback.Consume(packet, &error)) << error;
    }
  }
  // Malformed packets are skipped, not fatal.
  EXPECT_TRUE(playback.Consume(core::Frame(std::vector<uint8_t>{1}), &error));
  playback.Finish();
  EXPECT_EQ(playback.frames_completed(), 3u);
  EXPECT_EQ(playback.frames_dropped(), 0u);
}

}  // namespace
}  // namespace peerlink::video::testing
