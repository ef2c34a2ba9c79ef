// Repository: Whipcast
// Component: PCM Buffer Tests
// Purpose: Verify exact-count pops across frame boundaries, underflow and
//          the depth cap.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include <cstdint>

#include "whipcast/media/PcmBuffer.hpp"

namespace whipcast::media::testing {
namespace {

AudioFrame MakeRamp(int nb_samples, int16_t start) {
  AudioFrame frame;
  frame.nb_samples = nb_samples;
  frame.samples.resize(static_cast<size_t>(nb_samples) * kAudioChannels);
  for (int i = 0; i < nb_samples; ++i) {
    frame.samples[static_cast<size_t>(i) * 2] = static_cast<int16_t>(start + i);
    frame.samples[static_cast<size_t>(i) * 2 + 1] = static_cast<int16_t>(start + i);
  }
  return frame;
}

// Test a pop spanning two pushed frames returns contiguous samples
TEST(PcmBufferTest, PopSpansFrameBoundary) {
  PcmBuffer buffer;
  buffer.Push(MakeRamp(600, 0));
  buffer.Push(MakeRamp(600, 600));

  AudioFrame out;
  ASSERT_TRUE(buffer.TryPopSamples(kAudioPacketSamples, out));
  EXPECT_EQ(out.nb_samples, kAudioPacketSamples);
  ASSERT_EQ(out.samples.size(), static_cast<size_t>(kAudioPacketSamples) * 2);
  for (int i = 0; i < kAudioPacketSamples; ++i) {
    EXPECT_EQ(out.samples[static_cast<size_t>(i) * 2], i);
  }
  EXPECT_EQ(buffer.DepthSamples(), 1200 - kAudioPacketSamples);
}

// Test underflow is counted and leaves the buffer intact
TEST(PcmBufferTest, UnderflowReturnsFalse) {
  PcmBuffer buffer;
  buffer.Push(MakeRamp(100, 0));

  AudioFrame out;
  EXPECT_FALSE(buffer.TryPopSamples(kAudioPacketSamples, out));
  EXPECT_EQ(buffer.UnderflowCount(), 1);
  EXPECT_EQ(buffer.DepthSamples(), 100);
}

// Test pushing past the cap drops the oldest audio
TEST(PcmBufferTest, DepthCapDropsOldest) {
  PcmBuffer buffer(40);  // 1920 samples
  buffer.Push(MakeRamp(1000, 0));
  buffer.Push(MakeRamp(1000, 1000));
  buffer.Push(MakeRamp(1000, 2000));

  EXPECT_EQ(buffer.DepthSamples(), 1920);
  EXPECT_EQ(buffer.DroppedSamples(), 1080);
  EXPECT_EQ(buffer.DepthMs(), 40);

  AudioFrame out;
  ASSERT_TRUE(buffer.TryPopSamples(1, out));
  EXPECT_EQ(out.samples[0], 1080);
}

// Test Reset clears depth and counters
TEST(PcmBufferTest, ResetClearsEverything) {
  PcmBuffer buffer;
  buffer.Push(MakeRamp(500, 0));
  AudioFrame out;
  EXPECT_FALSE(buffer.TryPopSamples(1000, out));
  buffer.Reset();
  EXPECT_EQ(buffer.DepthSamples(), 0);
  EXPECT_EQ(buffer.UnderflowCount(), 0);
}

}  // namespace
}  // namespace whipcast::media::testing
