#ifndef WHIPCAST_TESTS_FIXTURES_STUB_MEDIA_HPP_
#define WHIPCAST_TESTS_FIXTURES_STUB_MEDIA_HPP_

#include <cstdint>
#include <mutex>
#include <string>

#include "whipcast/media/Frames.hpp"
#include "whipcast/media/IAudioTrack.hpp"
#include "whipcast/media/IFrameSource.hpp"

namespace whipcast::tests::fixtures {

// Solid-color RGBA frame.
inline media::VideoFrame MakeSolidFrame(int width, int height, uint8_t r, uint8_t g,
                                        uint8_t b, uint8_t a = 255) {
  media::VideoFrame frame;
  frame.Allocate(width, height);
  for (size_t i = 0; i < frame.rgba.size(); i += 4) {
    frame.rgba[i] = r;
    frame.rgba[i + 1] = g;
    frame.rgba[i + 2] = b;
    frame.rgba[i + 3] = a;
  }
  return frame;
}

// Frame whose left half is one color and right half another.
inline media::VideoFrame MakeSplitFrame(int width, int height,
                                        uint8_t left_r, uint8_t right_r) {
  media::VideoFrame frame;
  frame.Allocate(width, height);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      uint8_t* px = frame.rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
      px[0] = x < width / 2 ? left_r : right_r;
      px[1] = 0;
      px[2] = 0;
      px[3] = 255;
    }
  }
  return frame;
}

// Frame source that hands out whatever frame the test set, if any.
class StubFrameSource : public media::IFrameSource {
 public:
  StubFrameSource() = default;
  explicit StubFrameSource(media::VideoFrame frame) : frame_(std::move(frame)), has_frame_(true) {}

  void SetFrame(media::VideoFrame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    frame_ = std::move(frame);
    has_frame_ = true;
  }

  void ClearFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    has_frame_ = false;
  }

  bool LatestFrame(media::VideoFrame& out) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads_;
    if (!has_frame_ || stopped_) return false;
    out = frame_;
    return true;
  }

  void Stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopped_) ++stop_calls_;
    stopped_ = true;
  }

  bool IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }
  int stop_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_calls_;
  }
  int reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex mutex_;
  media::VideoFrame frame_;
  bool has_frame_ = false;
  bool stopped_ = false;
  int stop_calls_ = 0;
  int reads_ = 0;
};

// Audio track producing a constant sample value.
class StubAudioTrack : public media::IAudioTrack {
 public:
  explicit StubAudioTrack(std::string label = "stub", int16_t value = 1000)
      : label_(std::move(label)), value_(value) {}

  void ReadSamples(int nb_samples, media::AudioFrame& out) override {
    ++reads_;
    media::FillSilence(nb_samples, out);
    if (!enabled_ || stopped_) return;
    for (auto& sample : out.samples) sample = value_;
  }

  void Stop() override {
    if (!stopped_) ++stop_calls_;
    stopped_ = true;
  }
  bool IsStopped() const override { return stopped_; }
  void SetEnabled(bool enabled) override { enabled_ = enabled; }
  bool IsEnabled() const override { return enabled_; }
  std::string Label() const override { return label_; }

  int stop_calls() const { return stop_calls_; }
  int reads() const { return reads_; }

 private:
  std::string label_;
  int16_t value_;
  bool stopped_ = false;
  bool enabled_ = true;
  int stop_calls_ = 0;
  int reads_ = 0;
};

}  // namespace whipcast::tests::fixtures

#endif  // WHIPCAST_TESTS_FIXTURES_STUB_MEDIA_HPP_
