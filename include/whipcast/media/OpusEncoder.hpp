// Repository: Whipcast
// Component: Opus Encoder
// Purpose: 20 ms house-format PCM packets → Opus (libopus via libavcodec)
//          for the WebRTC audio sender.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_OPUS_ENCODER_HPP_
#define WHIPCAST_MEDIA_OPUS_ENCODER_HPP_

#include <cstdint>
#include <vector>

#include "whipcast/media/Frames.hpp"
#include "whipcast/media/VideoEncoder.hpp"  // EncodedPacket

struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace whipcast::media {

class OpusEncoder {
 public:
  OpusEncoder();
  ~OpusEncoder();

  OpusEncoder(const OpusEncoder&) = delete;
  OpusEncoder& operator=(const OpusEncoder&) = delete;

  bool Open(int64_t bitrate = 64000);
  void Close();
  bool IsOpen() const { return codec_ctx_ != nullptr; }

  // frame must hold exactly kAudioPacketSamples samples.
  bool Encode(const AudioFrame& frame, std::vector<EncodedPacket>& out);

 private:
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  int64_t next_pts_ = 0;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_OPUS_ENCODER_HPP_
