// Repository: Whipcast
// Component: Audio Track Provider
// Purpose: Resolves exactly one live audio track for the session by priority
//          (external → microphone → synthesized silence) and owns whatever it
//          acquired.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_AUDIO_AUDIO_TRACK_PROVIDER_HPP_
#define WHIPCAST_AUDIO_AUDIO_TRACK_PROVIDER_HPP_

#include <functional>
#include <memory>
#include <variant>

#include "whipcast/capture/ICaptureDevices.hpp"
#include "whipcast/media/IAudioTrack.hpp"
#include "whipcast/runtime/Errors.hpp"

namespace whipcast::audio {

enum class AudioProvenance {
  kExternal,    // caller-owned; never stopped here
  kMicrophone,  // acquired here; stopped on release
  kSilent,      // synthesized here; stopped (context closed) on release
};

const char* AudioProvenanceName(AudioProvenance provenance);

struct ResolvedAudioTrack {
  std::shared_ptr<media::IAudioTrack> track;
  AudioProvenance provenance = AudioProvenance::kSilent;

  bool owned() const { return provenance != AudioProvenance::kExternal; }
  explicit operator bool() const { return track != nullptr; }
};

struct ExternalAudioSource {
  std::shared_ptr<media::IAudioTrack> track;
};

struct MicrophoneAudioSource {
  capture::MicrophoneConstraints constraints;
  bool enabled = true;
};

struct SilentAudioSource {};

using AudioSourceSpec =
    std::variant<ExternalAudioSource, MicrophoneAudioSource, SilentAudioSource>;

// AudioTrackProvider never throws and never leaves the session without a
// track: a failed microphone degrades to silence and reports
// kDeviceUnavailable through the warning callback.
//
// Change notifications fire after the new track is live and before the
// previous owned track is stopped, so a sender can swap without a gap.
//
// Thread Safety: event-loop only.
class AudioTrackProvider {
 public:
  using ChangeCallback = std::function<void(const ResolvedAudioTrack&)>;
  using WarningCallback = std::function<void(const runtime::CallResult&)>;

  explicit AudioTrackProvider(capture::ICaptureDevices& devices);
  ~AudioTrackProvider();

  AudioTrackProvider(const AudioTrackProvider&) = delete;
  AudioTrackProvider& operator=(const AudioTrackProvider&) = delete;

  void OnChange(ChangeCallback callback) { on_change_ = std::move(callback); }
  void OnWarning(WarningCallback callback) { on_warning_ = std::move(callback); }

  // Re-evaluates the priority chain for spec. Always returns a live track.
  const ResolvedAudioTrack& Resolve(const AudioSourceSpec& spec);

  // Acquires the microphone on demand and swaps it in. On failure the current
  // track is kept and the error is returned (and reported as a warning).
  runtime::CallResult RequestMicrophone(const capture::MicrophoneConstraints& constraints);

  // Mutes/unmutes the current microphone track without releasing it.
  // Returns false when the current track is not a microphone.
  bool SetMicrophoneEnabled(bool enabled);

  // Stops every owned track. External tracks are left alone. Idempotent.
  void Release();

  const ResolvedAudioTrack& Current() const { return current_; }

 private:
  ResolvedAudioTrack MakeSilent();
  void Install(ResolvedAudioTrack next);
  void Warn(const runtime::CallResult& result);

  capture::ICaptureDevices& devices_;
  ResolvedAudioTrack current_;
  ChangeCallback on_change_;
  WarningCallback on_warning_;
};

}  // namespace whipcast::audio

#endif  // WHIPCAST_AUDIO_AUDIO_TRACK_PROVIDER_HPP_
