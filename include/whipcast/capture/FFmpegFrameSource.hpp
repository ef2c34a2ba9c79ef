// Repository: Whipcast
// Component: FFmpeg Frame Source
// Purpose: Decodes a camera device or media URL on its own thread and keeps
//          the latest RGBA frame for the compositor.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_CAPTURE_FFMPEG_FRAME_SOURCE_HPP_
#define WHIPCAST_CAPTURE_FFMPEG_FRAME_SOURCE_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "whipcast/media/IFrameSource.hpp"
#include "whipcast/runtime/Errors.hpp"

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace whipcast::capture {

struct FrameSourceConfig {
  std::string input_uri;     // "/dev/video0", "rtsp://...", "clip.mp4"
  std::string input_format;  // libavdevice format ("v4l2"); empty = probe
  int width = 0;             // requested capture size (devices only)
  int height = 0;
  int fps = 0;
  // Files are paced to their timestamps and looped; live inputs are not.
  bool realtime_pacing = false;
  bool loop = false;
};

// Lifecycle:
//   1. Construct with config
//   2. Open() opens the input and starts the decode thread
//   3. LatestFrame() from any thread
//   4. Stop() or destructor joins the thread and frees FFmpeg state
//
// Decode errors on a live input end the thread; LatestFrame() then keeps
// returning the last good frame.
class FFmpegFrameSource : public media::IFrameSource {
 public:
  explicit FFmpegFrameSource(FrameSourceConfig config);
  ~FFmpegFrameSource() override;

  FFmpegFrameSource(const FFmpegFrameSource&) = delete;
  FFmpegFrameSource& operator=(const FFmpegFrameSource&) = delete;

  runtime::CallResult Open();

  bool LatestFrame(media::VideoFrame& out) override;
  void Stop() override;

  uint64_t FramesDecoded() const { return frames_decoded_.load(std::memory_order_relaxed); }

 private:
  static int InterruptCallback(void* opaque);

  void DecodeLoop();
  bool ConvertAndPublish(AVFrame* frame);
  void Close();

  FrameSourceConfig config_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int video_stream_index_ = -1;

  std::mutex latest_mutex_;
  media::VideoFrame latest_;
  bool has_frame_ = false;

  std::atomic<bool> stop_{false};
  std::atomic<uint64_t> frames_decoded_{0};
  std::thread decode_thread_;
  bool stopped_ = false;
};

}  // namespace whipcast::capture

#endif  // WHIPCAST_CAPTURE_FFMPEG_FRAME_SOURCE_HPP_
