// Repository: Whipcast
// Component: FFmpeg Microphone Track
// Purpose: Captures an audio input (pulse/alsa device or media URL),
//          resamples to house format and serves 20 ms pulls from a PcmBuffer.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_CAPTURE_FFMPEG_MICROPHONE_TRACK_HPP_
#define WHIPCAST_CAPTURE_FFMPEG_MICROPHONE_TRACK_HPP_

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "whipcast/media/IAudioTrack.hpp"
#include "whipcast/media/PcmBuffer.hpp"
#include "whipcast/runtime/Errors.hpp"

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace whipcast::capture {

struct AudioInputConfig {
  std::string input_uri;     // "default", "hw:0", or a media URL
  std::string input_format;  // "pulse", "alsa"; empty = probe
  std::string label = "microphone";
};

class FFmpegMicrophoneTrack : public media::IAudioTrack {
 public:
  explicit FFmpegMicrophoneTrack(AudioInputConfig config);
  ~FFmpegMicrophoneTrack() override;

  FFmpegMicrophoneTrack(const FFmpegMicrophoneTrack&) = delete;
  FFmpegMicrophoneTrack& operator=(const FFmpegMicrophoneTrack&) = delete;

  runtime::CallResult Open();

  void ReadSamples(int nb_samples, media::AudioFrame& out) override;
  void Stop() override;
  bool IsStopped() const override { return stopped_.load(std::memory_order_acquire); }
  void SetEnabled(bool enabled) override { enabled_.store(enabled, std::memory_order_release); }
  bool IsEnabled() const override { return enabled_.load(std::memory_order_acquire); }
  std::string Label() const override { return config_.label; }

 private:
  static int InterruptCallback(void* opaque);

  void CaptureLoop();
  void ResampleAndPush(AVFrame* frame);
  void Close();

  AudioInputConfig config_;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  int audio_stream_index_ = -1;

  media::PcmBuffer buffer_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> enabled_{true};
  std::mutex stop_mutex_;
  std::thread capture_thread_;
};

}  // namespace whipcast::capture

#endif  // WHIPCAST_CAPTURE_FFMPEG_MICROPHONE_TRACK_HPP_
