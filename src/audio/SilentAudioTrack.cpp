// Repository: Whipcast
// Component: Silent Audio Track
// Purpose: Synthesized zero-gain fallback track.
// Copyright (c) 2025 Whipcast

#include "whipcast/audio/SilentAudioTrack.hpp"

#include <cmath>

#include "whipcast/util/Logger.hpp"

namespace whipcast::audio {

namespace {
constexpr double kTwoPi = 6.283185307179586;
}  // namespace

SynthAudioContext::SynthAudioContext(int sample_rate, double oscillator_hz)
    : sample_rate_(sample_rate), oscillator_hz_(oscillator_hz) {}

void SynthAudioContext::Render(int nb_samples, double gain, media::AudioFrame& out) {
  media::FillSilence(nb_samples, out);
  if (IsClosed()) return;
  const double step = kTwoPi * oscillator_hz_ / sample_rate_;
  for (int i = 0; i < nb_samples; ++i) {
    const double value = std::sin(phase_) * gain * 32767.0;
    const auto sample = static_cast<int16_t>(std::lround(value));
    for (int c = 0; c < out.channels; ++c) {
      out.samples[static_cast<size_t>(i) * out.channels + c] = sample;
    }
    phase_ += step;
    if (phase_ >= kTwoPi) phase_ -= kTwoPi;
  }
}

void SynthAudioContext::Close() {
  closed_.store(true, std::memory_order_release);
}

SilentAudioTrack::SilentAudioTrack() : context_(std::make_unique<SynthAudioContext>()) {}

SilentAudioTrack::~SilentAudioTrack() {
  Stop();
}

void SilentAudioTrack::ReadSamples(int nb_samples, media::AudioFrame& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Gain is pinned to zero: the oscillator only keeps the graph alive.
  context_->Render(nb_samples, 0.0, out);
}

void SilentAudioTrack::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) return;
  stopped_ = true;
  context_->Close();
  util::Logger::Debug("[SilentAudioTrack] synth context closed");
}

bool SilentAudioTrack::IsStopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

void SilentAudioTrack::SetEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = enabled;
}

bool SilentAudioTrack::IsEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

}  // namespace whipcast::audio
