// Repository: Whipcast
// Component: PcmBuffer
// Purpose: Decouples microphone capture from the 20 ms audio sender pull.
// Copyright (c) 2025 Whipcast

#include "whipcast/media/PcmBuffer.hpp"

#include <algorithm>
#include <cstring>

namespace whipcast::media {

PcmBuffer::PcmBuffer(int max_depth_ms, int sample_rate, int channels)
    : sample_rate_(sample_rate),
      channels_(channels),
      max_depth_samples_(sample_rate * max_depth_ms / 1000) {}

void PcmBuffer::Push(AudioFrame frame) {
  if (frame.nb_samples <= 0) return;
  std::lock_guard<std::mutex> lock(mutex_);
  total_samples_in_buffer_ += frame.nb_samples;
  frames_.push_back(std::move(frame));
  if (total_samples_in_buffer_ > max_depth_samples_) {
    DropOldestLocked(static_cast<int>(total_samples_in_buffer_ - max_depth_samples_));
  }
}

bool PcmBuffer::TryPopSamples(int samples_needed, AudioFrame& out) {
  out.sample_rate = sample_rate_;
  out.channels = channels_;
  if (samples_needed <= 0) {
    out.nb_samples = 0;
    out.samples.clear();
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (total_samples_in_buffer_ < samples_needed) {
    underflow_count_++;
    return false;
  }

  out.nb_samples = samples_needed;
  out.samples.resize(static_cast<size_t>(samples_needed) * channels_);

  int remaining = samples_needed;
  size_t out_offset = 0;
  while (remaining > 0 && !frames_.empty()) {
    AudioFrame& front = frames_.front();
    const int avail = front.nb_samples - front_consumed_;
    const int take = std::min(avail, remaining);
    std::memcpy(out.samples.data() + out_offset,
                front.samples.data() + static_cast<size_t>(front_consumed_) * channels_,
                static_cast<size_t>(take) * channels_ * sizeof(int16_t));
    out_offset += static_cast<size_t>(take) * channels_;
    remaining -= take;
    front_consumed_ += take;
    if (front_consumed_ >= front.nb_samples) {
      frames_.pop_front();
      front_consumed_ = 0;
    }
  }

  total_samples_in_buffer_ -= samples_needed;
  return true;
}

void PcmBuffer::DropOldestLocked(int samples) {
  while (samples > 0 && !frames_.empty()) {
    AudioFrame& front = frames_.front();
    const int avail = front.nb_samples - front_consumed_;
    const int take = std::min(avail, samples);
    front_consumed_ += take;
    samples -= take;
    total_samples_in_buffer_ -= take;
    dropped_samples_ += take;
    if (front_consumed_ >= front.nb_samples) {
      frames_.pop_front();
      front_consumed_ = 0;
    }
  }
}

int PcmBuffer::DepthMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sample_rate_ <= 0) return 0;
  return static_cast<int>((total_samples_in_buffer_ * 1000) / sample_rate_);
}

int PcmBuffer::DepthSamples() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(total_samples_in_buffer_);
}

int64_t PcmBuffer::UnderflowCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return underflow_count_;
}

int64_t PcmBuffer::DroppedSamples() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_samples_;
}

void PcmBuffer::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  frames_.clear();
  front_consumed_ = 0;
  total_samples_in_buffer_ = 0;
  underflow_count_ = 0;
  dropped_samples_ = 0;
}

}  // namespace whipcast::media
