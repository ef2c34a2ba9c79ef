// Repository: Whipcast
// Component: Audio Track Interface
// Purpose: Pull-model PCM source handed to the publisher's audio sender.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_IAUDIO_TRACK_HPP_
#define WHIPCAST_MEDIA_IAUDIO_TRACK_HPP_

#include <string>

#include "whipcast/media/Frames.hpp"

namespace whipcast::media {

class IAudioTrack {
 public:
  virtual ~IAudioTrack() = default;

  // Fills out with exactly nb_samples of house-format audio. Disabled,
  // stopped or starved tracks produce silence.
  virtual void ReadSamples(int nb_samples, AudioFrame& out) = 0;

  // Releases the underlying device or generator. Idempotent.
  virtual void Stop() = 0;
  virtual bool IsStopped() const = 0;

  // Mute without releasing.
  virtual void SetEnabled(bool enabled) = 0;
  virtual bool IsEnabled() const = 0;

  virtual std::string Label() const = 0;
};

// Fills frame with silence of the given length.
inline void FillSilence(int nb_samples, AudioFrame& out) {
  out.sample_rate = kAudioSampleRate;
  out.channels = kAudioChannels;
  out.nb_samples = nb_samples;
  out.samples.assign(static_cast<size_t>(nb_samples) * kAudioChannels, 0);
}

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_IAUDIO_TRACK_HPP_
