// Repository: Whipcast
// Component: Video Encoder
// Purpose: RGBA → YUV420P → H.264 (libx264, zero-latency) for the WebRTC
//          video sender.
// Copyright (c) 2025 Whipcast

#include "whipcast/media/VideoEncoder.hpp"

#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include "whipcast/util/Logger.hpp"

namespace whipcast::media {

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() {
  Close();
}

bool VideoEncoder::Open(const VideoEncoderConfig& config) {
  Close();
  config_ = config;

  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) {
    util::Logger::Error("[VideoEncoder] libx264 not found");
    return false;
  }

  av_log_set_level(AV_LOG_ERROR);

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    util::Logger::Error("[VideoEncoder] Failed to allocate codec context");
    return false;
  }

  codec_ctx_->width = config.width;
  codec_ctx_->height = config.height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->time_base = AVRational{1, config.fps};
  codec_ctx_->framerate = AVRational{config.fps, 1};
  codec_ctx_->gop_size = config.gop_size > 0 ? config.gop_size : config.fps * 2;
  codec_ctx_->max_b_frames = 0;
  codec_ctx_->bit_rate = config.bitrate;
  codec_ctx_->rc_max_rate = config.bitrate;
  codec_ctx_->rc_buffer_size = static_cast<int>(config.bitrate / 2);

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "preset", "ultrafast", 0);
  // zerolatency: no lookahead, no B-frames, slice-based threading.
  av_dict_set(&opts, "tune", "zerolatency", 0);
  av_dict_set(&opts, "profile", "baseline", 0);
  // Repeat SPS/PPS on every IDR so a receiver can join at any keyframe.
  av_dict_set(&opts, "x264-params", "repeat-headers=1:bframes=0", 0);
  int ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to open codec: " + AvError(ret));
    Close();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    util::Logger::Error("[VideoEncoder] Failed to allocate frame/packet");
    Close();
    return false;
  }
  frame_->format = AV_PIX_FMT_YUV420P;
  frame_->width = config.width;
  frame_->height = config.height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to allocate frame buffer: " + AvError(ret));
    Close();
    return false;
  }

  frame_index_ = 0;
  force_keyframe_ = true;
  util::Logger::Info("[VideoEncoder] Opened libx264 " + std::to_string(config.width) + "x" +
                     std::to_string(config.height) + "@" + std::to_string(config.fps));
  return true;
}

void VideoEncoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
}

bool VideoEncoder::Encode(const VideoFrame& frame, std::vector<EncodedPacket>& out) {
  if (!codec_ctx_ || frame.Empty()) return false;

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Frame not writable: " + AvError(ret));
    return false;
  }

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      frame.width, frame.height, AV_PIX_FMT_RGBA,
      config_.width, config_.height, AV_PIX_FMT_YUV420P,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    util::Logger::Error("[VideoEncoder] Failed to create RGBA→YUV420P converter");
    return false;
  }
  const uint8_t* src[1] = {frame.rgba.data()};
  const int src_stride[1] = {frame.Stride()};
  sws_scale(sws_ctx_, src, src_stride, 0, frame.height, frame_->data, frame_->linesize);

  frame_->pts = frame_index_++;
  if (force_keyframe_) {
    frame_->pict_type = AV_PICTURE_TYPE_I;
    force_keyframe_ = false;
  } else {
    frame_->pict_type = AV_PICTURE_TYPE_NONE;
  }

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Error sending frame: " + AvError(ret));
    return false;
  }

  constexpr int kMaxPacketsPerFrame = 10;
  for (int n = 0; n < kMaxPacketsPerFrame; ++n) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      util::Logger::Error("[VideoEncoder] Error receiving packet: " + AvError(ret));
      return false;
    }
    EncodedPacket pkt;
    pkt.data.assign(packet_->data, packet_->data + packet_->size);
    pkt.pts = av_rescale_q(packet_->pts, codec_ctx_->time_base, AVRational{1, 90000});
    pkt.keyframe = (packet_->flags & AV_PKT_FLAG_KEY) != 0;
    out.push_back(std::move(pkt));
    av_packet_unref(packet_);
  }
  return true;
}

}  // namespace whipcast::media
