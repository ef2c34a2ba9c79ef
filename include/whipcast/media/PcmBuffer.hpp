// Repository: Whipcast
// Component: PcmBuffer
// Purpose: Decouples microphone capture from the 20 ms audio sender pull.
//          The capture thread pushes decoded frames; the sender pops exact
//          packet-sized sample counts.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_PCM_BUFFER_HPP_
#define WHIPCAST_MEDIA_PCM_BUFFER_HPP_

#include <cstdint>
#include <deque>
#include <mutex>

#include "whipcast/media/Frames.hpp"

namespace whipcast::media {

// PcmBuffer accumulates house-format audio and dispenses exact per-pull
// sample counts, splitting frames transparently.
//
// Live capture must not build latency, so depth is capped: pushing past
// max_depth_ms drops the oldest audio.
//
// Underflow (buffer cannot satisfy a pop) increments the underflow counter
// and returns false; the caller substitutes silence.
//
// Thread safety: all public methods are mutex-protected.
class PcmBuffer {
 public:
  explicit PcmBuffer(int max_depth_ms = 200,
                     int sample_rate = kAudioSampleRate,
                     int channels = kAudioChannels);

  PcmBuffer(const PcmBuffer&) = delete;
  PcmBuffer& operator=(const PcmBuffer&) = delete;

  void Push(AudioFrame frame);

  // Pops exactly samples_needed samples into out. Non-blocking.
  bool TryPopSamples(int samples_needed, AudioFrame& out);

  int DepthMs() const;
  int DepthSamples() const;
  int64_t UnderflowCount() const;
  int64_t DroppedSamples() const;

  void Reset();

 private:
  void DropOldestLocked(int samples);

  const int sample_rate_;
  const int channels_;
  const int max_depth_samples_;

  mutable std::mutex mutex_;
  std::deque<AudioFrame> frames_;
  // Samples already consumed from frames_.front().
  int front_consumed_ = 0;
  int64_t total_samples_in_buffer_ = 0;
  int64_t underflow_count_ = 0;
  int64_t dropped_samples_ = 0;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_PCM_BUFFER_HPP_
