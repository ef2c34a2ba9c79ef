// Repository: Whipcast
// Component: Audio Track Provider
// Purpose: Priority-ordered audio track resolution with owned-track teardown.
// Copyright (c) 2025 Whipcast

#include "whipcast/audio/AudioTrackProvider.hpp"

#include "whipcast/audio/SilentAudioTrack.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::audio {

const char* AudioProvenanceName(AudioProvenance provenance) {
  switch (provenance) {
    case AudioProvenance::kExternal: return "external";
    case AudioProvenance::kMicrophone: return "microphone";
    case AudioProvenance::kSilent: return "silent";
  }
  return "unknown";
}

AudioTrackProvider::AudioTrackProvider(capture::ICaptureDevices& devices)
    : devices_(devices) {}

AudioTrackProvider::~AudioTrackProvider() {
  Release();
}

const ResolvedAudioTrack& AudioTrackProvider::Resolve(const AudioSourceSpec& spec) {
  // 1) External track supplied by the caller.
  if (const auto* external = std::get_if<ExternalAudioSource>(&spec)) {
    if (external->track && !external->track->IsStopped()) {
      if (current_.track != external->track) {
        Install(ResolvedAudioTrack{external->track, AudioProvenance::kExternal});
      }
      return current_;
    }
    Warn(runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                      "external audio track missing or ended"));
  }

  // 2) Microphone, if enabled and permitted.
  if (const auto* mic = std::get_if<MicrophoneAudioSource>(&spec)) {
    if (mic->enabled) {
      if (current_.provenance == AudioProvenance::kMicrophone && current_.track &&
          !current_.track->IsStopped()) {
        return current_;
      }
      auto opened = devices_.OpenMicrophone(mic->constraints);
      if (opened.result.success && opened.device) {
        Install(ResolvedAudioTrack{std::move(opened.device), AudioProvenance::kMicrophone});
        return current_;
      }
      Warn(runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "microphone unavailable: " + opened.result.message));
    }
  }

  // 3) Synthesized silence.
  if (current_.provenance != AudioProvenance::kSilent || !current_.track ||
      current_.track->IsStopped()) {
    Install(MakeSilent());
  }
  return current_;
}

runtime::CallResult AudioTrackProvider::RequestMicrophone(
    const capture::MicrophoneConstraints& constraints) {
  auto opened = devices_.OpenMicrophone(constraints);
  if (!opened.result.success || !opened.device) {
    auto failure = runtime::CallResult::Failure(
        runtime::ErrorKind::kDeviceUnavailable,
        "microphone unavailable: " + opened.result.message);
    Warn(failure);
    return failure;
  }
  Install(ResolvedAudioTrack{std::move(opened.device), AudioProvenance::kMicrophone});
  return runtime::CallResult::Ok();
}

bool AudioTrackProvider::SetMicrophoneEnabled(bool enabled) {
  if (current_.provenance != AudioProvenance::kMicrophone || !current_.track) {
    return false;
  }
  current_.track->SetEnabled(enabled);
  util::Logger::Info(std::string("[AudioTrackProvider] Microphone ") +
                     (enabled ? "enabled" : "muted"));
  return true;
}

void AudioTrackProvider::Release() {
  if (!current_.track) return;
  if (current_.owned()) {
    current_.track->Stop();
    util::Logger::Debug(std::string("[AudioTrackProvider] Released ") +
                        AudioProvenanceName(current_.provenance) + " track");
  }
  current_ = ResolvedAudioTrack{};
}

ResolvedAudioTrack AudioTrackProvider::MakeSilent() {
  return ResolvedAudioTrack{std::make_shared<SilentAudioTrack>(), AudioProvenance::kSilent};
}

void AudioTrackProvider::Install(ResolvedAudioTrack next) {
  ResolvedAudioTrack previous = std::move(current_);
  current_ = std::move(next);
  util::Logger::Info(std::string("[AudioTrackProvider] Audio source: ") +
                     AudioProvenanceName(current_.provenance) + " (" +
                     current_.track->Label() + ")");
  if (on_change_) on_change_(current_);
  if (previous.track && previous.owned() && previous.track != current_.track) {
    previous.track->Stop();
  }
}

void AudioTrackProvider::Warn(const runtime::CallResult& result) {
  util::Logger::Warn("[AudioTrackProvider] " + runtime::Describe(result));
  if (on_warning_) on_warning_(result);
}

}  // namespace whipcast::audio
