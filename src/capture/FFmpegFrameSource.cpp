// Repository: Whipcast
// Component: FFmpeg Frame Source
// Purpose: Decodes a camera device or media URL on its own thread and keeps
//          the latest RGBA frame for the compositor.
// Copyright (c) 2025 Whipcast

#include "whipcast/capture/FFmpegFrameSource.hpp"

#include <chrono>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

#include "capture/FFmpegInit.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::capture {

FFmpegFrameSource::FFmpegFrameSource(FrameSourceConfig config) : config_(std::move(config)) {}

FFmpegFrameSource::~FFmpegFrameSource() {
  Stop();
}

int FFmpegFrameSource::InterruptCallback(void* opaque) {
  auto* self = static_cast<FFmpegFrameSource*>(opaque);
  return self->stop_.load(std::memory_order_acquire) ? 1 : 0;
}

runtime::CallResult FFmpegFrameSource::Open() {
  EnsureFFmpegDevicesRegistered();
  util::Logger::Info("[FFmpegFrameSource] Opening: " + config_.input_uri);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "failed to allocate format context");
  }
  format_ctx_->interrupt_callback.callback = &FFmpegFrameSource::InterruptCallback;
  format_ctx_->interrupt_callback.opaque = this;

  const AVInputFormat* input_format = nullptr;
  if (!config_.input_format.empty()) {
    input_format = av_find_input_format(config_.input_format.c_str());
    if (!input_format) {
      Close();
      return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                          "input format not available: " + config_.input_format);
    }
  }

  AVDictionary* opts = nullptr;
  if (config_.width > 0 && config_.height > 0) {
    const std::string size = std::to_string(config_.width) + "x" + std::to_string(config_.height);
    av_dict_set(&opts, "video_size", size.c_str(), 0);
  }
  if (config_.fps > 0) {
    av_dict_set(&opts, "framerate", std::to_string(config_.fps).c_str(), 0);
  }

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), input_format, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    util::Logger::Warn("[FFmpegFrameSource] open_input FAILED uri=" + config_.input_uri +
                       " err=" + AvErrorString(ret));
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "cannot open " + config_.input_uri + ": " +
                                            AvErrorString(ret));
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Close();
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "no stream info: " + AvErrorString(ret));
  }

  const AVCodec* codec = nullptr;
  video_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
  if (video_stream_index_ < 0 || !codec) {
    Close();
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "no video stream in " + config_.input_uri);
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_ ||
      avcodec_parameters_to_context(codec_ctx_,
                                    format_ctx_->streams[video_stream_index_]->codecpar) < 0) {
    Close();
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "cannot configure decoder");
  }
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Close();
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "cannot open decoder: " + AvErrorString(ret));
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    Close();
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                        "failed to allocate frame/packet");
  }

  stop_.store(false, std::memory_order_release);
  decode_thread_ = std::thread([this] { DecodeLoop(); });
  util::Logger::Info("[FFmpegFrameSource] Decoding " + config_.input_uri + " (" +
                     std::to_string(codec_ctx_->width) + "x" +
                     std::to_string(codec_ctx_->height) + ")");
  return runtime::CallResult::Ok();
}

bool FFmpegFrameSource::LatestFrame(media::VideoFrame& out) {
  std::lock_guard<std::mutex> lock(latest_mutex_);
  if (!has_frame_) return false;
  out = latest_;
  return true;
}

void FFmpegFrameSource::Stop() {
  if (stopped_) return;
  stopped_ = true;
  stop_.store(true, std::memory_order_release);
  if (decode_thread_.joinable()) {
    decode_thread_.join();
  }
  Close();
  util::Logger::Debug("[FFmpegFrameSource] Stopped " + config_.input_uri);
}

void FFmpegFrameSource::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) avformat_close_input(&format_ctx_);
  video_stream_index_ = -1;
}

void FFmpegFrameSource::DecodeLoop() {
  const AVStream* stream = format_ctx_->streams[video_stream_index_];
  const auto wall_start = std::chrono::steady_clock::now();
  int64_t pts_origin = AV_NOPTS_VALUE;

  while (!stop_.load(std::memory_order_acquire)) {
    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF && config_.loop) {
      av_seek_frame(format_ctx_, video_stream_index_, 0, AVSEEK_FLAG_BACKWARD);
      avcodec_flush_buffers(codec_ctx_);
      pts_origin = AV_NOPTS_VALUE;
      continue;
    }
    if (ret == AVERROR(EAGAIN)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      continue;
    }
    if (ret < 0) {
      if (!stop_.load(std::memory_order_acquire)) {
        util::Logger::Warn("[FFmpegFrameSource] read ended uri=" + config_.input_uri +
                           " err=" + AvErrorString(ret));
      }
      break;
    }
    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) continue;

    while (avcodec_receive_frame(codec_ctx_, frame_) == 0) {
      if (config_.realtime_pacing && frame_->best_effort_timestamp != AV_NOPTS_VALUE) {
        const int64_t pts_us = av_rescale_q(frame_->best_effort_timestamp, stream->time_base,
                                            AVRational{1, 1000000});
        if (pts_origin == AV_NOPTS_VALUE) pts_origin = pts_us;
        const auto due = wall_start + std::chrono::microseconds(pts_us - pts_origin);
        std::this_thread::sleep_until(due);
      }
      ConvertAndPublish(frame_);
      av_frame_unref(frame_);
    }
  }
}

bool FFmpegFrameSource::ConvertAndPublish(AVFrame* frame) {
  if (frame->width <= 0 || frame->height <= 0) return false;

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
      frame->width, frame->height, AV_PIX_FMT_RGBA,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) return false;

  media::VideoFrame converted;
  converted.Allocate(frame->width, frame->height);
  uint8_t* dst[1] = {converted.rgba.data()};
  const int dst_stride[1] = {converted.Stride()};
  sws_scale(sws_ctx_, frame->data, frame->linesize, 0, frame->height, dst, dst_stride);

  {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    latest_ = std::move(converted);
    has_frame_ = true;
  }
  frames_decoded_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

}  // namespace whipcast::capture
