// Repository: Whipcast
// Component: Silent Audio Track
// Purpose: Synthesized fallback track: an oscillator routed through a
//          zero-gain stage, so the published audio track always exists and
//          always carries (silent) samples.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_AUDIO_SILENT_AUDIO_TRACK_HPP_
#define WHIPCAST_AUDIO_SILENT_AUDIO_TRACK_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "whipcast/media/IAudioTrack.hpp"

namespace whipcast::audio {

// Minimal synthesis graph: oscillator → gain → destination. The context is
// the resource the provider must release on teardown.
class SynthAudioContext {
 public:
  explicit SynthAudioContext(int sample_rate = media::kAudioSampleRate,
                             double oscillator_hz = 440.0);

  // Renders nb_samples of (oscillator * gain) into interleaved S16.
  void Render(int nb_samples, double gain, media::AudioFrame& out);

  void Close();
  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

 private:
  int sample_rate_;
  double oscillator_hz_;
  double phase_ = 0.0;
  std::atomic<bool> closed_{false};
};

class SilentAudioTrack : public media::IAudioTrack {
 public:
  SilentAudioTrack();
  ~SilentAudioTrack() override;

  void ReadSamples(int nb_samples, media::AudioFrame& out) override;
  void Stop() override;
  bool IsStopped() const override;
  void SetEnabled(bool enabled) override;
  bool IsEnabled() const override;
  std::string Label() const override { return "silent"; }

  const SynthAudioContext& Context() const { return *context_; }

 private:
  mutable std::mutex mutex_;
  std::unique_ptr<SynthAudioContext> context_;
  bool stopped_ = false;
  bool enabled_ = true;
};

}  // namespace whipcast::audio

#endif  // WHIPCAST_AUDIO_SILENT_AUDIO_TRACK_HPP_
