// Repository: Whipcast
// Component: Media Frames
// Purpose: Raw video (RGBA) and audio (S16 interleaved) frame containers.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_FRAMES_HPP_
#define WHIPCAST_MEDIA_FRAMES_HPP_

#include <cstdint>
#include <vector>

namespace whipcast::media {

// House audio format: 48 kHz stereo S16, pulled in 20 ms packets.
constexpr int kAudioSampleRate = 48000;
constexpr int kAudioChannels = 2;
constexpr int kAudioPacketMs = 20;
constexpr int kAudioPacketSamples = kAudioSampleRate * kAudioPacketMs / 1000;  // 960

// Packed RGBA, stride = width * 4.
struct VideoFrame {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;
  int64_t pts_ms = 0;

  bool Empty() const { return width <= 0 || height <= 0 || rgba.empty(); }
  int Stride() const { return width * 4; }

  void Allocate(int w, int h) {
    width = w;
    height = h;
    rgba.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0);
  }

  const uint8_t* PixelAt(int x, int y) const {
    return rgba.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) +
                          static_cast<size_t>(x)) * 4;
  }
};

// Interleaved S16. nb_samples counts per-channel samples.
struct AudioFrame {
  int sample_rate = kAudioSampleRate;
  int channels = kAudioChannels;
  int nb_samples = 0;
  std::vector<int16_t> samples;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_FRAMES_HPP_
