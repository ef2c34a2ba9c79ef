// Repository: Whipcast
// Component: Video Encoder
// Purpose: RGBA → YUV420P → H.264 (libx264, zero-latency) for the WebRTC
//          video sender.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_VIDEO_ENCODER_HPP_
#define WHIPCAST_MEDIA_VIDEO_ENCODER_HPP_

#include <cstdint>
#include <vector>

#include "whipcast/media/Frames.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace whipcast::media {

struct EncodedPacket {
  std::vector<uint8_t> data;
  int64_t pts = 0;  // in the encoder's clock (90 kHz video, 48 kHz audio)
  bool keyframe = false;
};

struct VideoEncoderConfig {
  int width = 512;
  int height = 512;
  int fps = 24;
  int64_t bitrate = 1'500'000;
  // Keyframe interval in frames; 0 = 2 seconds.
  int gop_size = 0;
};

// Encoder output is Annex-B (start-code separated) H.264, which is what the
// RTP packetizer expects. No B-frames, so output order == input order.
//
// Not thread-safe: owned and driven by one sender.
class VideoEncoder {
 public:
  VideoEncoder();
  ~VideoEncoder();

  VideoEncoder(const VideoEncoder&) = delete;
  VideoEncoder& operator=(const VideoEncoder&) = delete;

  bool Open(const VideoEncoderConfig& config);
  void Close();
  bool IsOpen() const { return codec_ctx_ != nullptr; }

  // Encodes one frame (scaled if its size differs from the configured one)
  // and appends every packet the encoder releases.
  bool Encode(const VideoFrame& frame, std::vector<EncodedPacket>& out);

  // Forces the next encoded frame to be an IDR (after reconnect / PLI).
  void RequestKeyframe() { force_keyframe_ = true; }

 private:
  VideoEncoderConfig config_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int64_t frame_index_ = 0;
  bool force_keyframe_ = true;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_VIDEO_ENCODER_HPP_
