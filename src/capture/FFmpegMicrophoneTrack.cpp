// Repository: Whipcast
// Component: FFmpeg Microphone Track
// Purpose: Captures an audio input and serves 20 ms house-format pulls.
// Copyright (c) 2025 Whipcast

#include "whipcast/capture/FFmpegMicrophoneTrack.hpp"

#include <chrono>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "capture/FFmpegInit.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::capture {

FFmpegMicrophoneTrack::FFmpegMicrophoneTrack(AudioInputConfig config)
    : config_(std::move(config)) {}

FFmpegMicrophoneTrack::~FFmpegMicrophoneTrack() {
  Stop();
}

int FFmpegMicrophoneTrack::InterruptCallback(void* opaque) {
  auto* self = static_cast<FFmpegMicrophoneTrack*>(opaque);
  return self->stop_.load(std::memory_order_acquire) ? 1 : 0;
}

runtime::CallResult FFmpegMicrophoneTrack::Open() {
  EnsureFFmpegDevicesRegistered();
  util::Logger::Info("[FFmpegMicrophoneTrack] Opening: " + config_.input_uri +
                     (config_.input_format.empty() ? "" : " (" + config_.input_format + ")"));

  auto fail = [this](const std::string& message) {
    Close();
    util::Logger::Warn("[FFmpegMicrophoneTrack] " + message);
    return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable, message);
  };

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) return fail("failed to allocate format context");
  format_ctx_->interrupt_callback.callback = &FFmpegMicrophoneTrack::InterruptCallback;
  format_ctx_->interrupt_callback.opaque = this;

  const AVInputFormat* input_format = nullptr;
  if (!config_.input_format.empty()) {
    input_format = av_find_input_format(config_.input_format.c_str());
    if (!input_format) return fail("input format not available: " + config_.input_format);
  }

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), input_format, nullptr);
  if (ret < 0) {
    format_ctx_ = nullptr;
    return fail("cannot open " + config_.input_uri + ": " + AvErrorString(ret));
  }
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) return fail("no stream info: " + AvErrorString(ret));

  const AVCodec* codec = nullptr;
  audio_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (audio_stream_index_ < 0 || !codec) return fail("no audio stream in " + config_.input_uri);

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_ ||
      avcodec_parameters_to_context(codec_ctx_,
                                    format_ctx_->streams[audio_stream_index_]->codecpar) < 0) {
    return fail("cannot configure decoder");
  }
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) return fail("cannot open decoder: " + AvErrorString(ret));

  AVChannelLayout dst_layout;
  av_channel_layout_default(&dst_layout, media::kAudioChannels);
  ret = swr_alloc_set_opts2(&swr_ctx_,
                            &dst_layout, AV_SAMPLE_FMT_S16, media::kAudioSampleRate,
                            &codec_ctx_->ch_layout, codec_ctx_->sample_fmt,
                            codec_ctx_->sample_rate,
                            0, nullptr);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0 || !swr_ctx_ || swr_init(swr_ctx_) < 0) {
    return fail("cannot initialize resampler");
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) return fail("failed to allocate frame/packet");

  capture_thread_ = std::thread([this] { CaptureLoop(); });
  return runtime::CallResult::Ok();
}

void FFmpegMicrophoneTrack::ReadSamples(int nb_samples, media::AudioFrame& out) {
  if (IsStopped() || !buffer_.TryPopSamples(nb_samples, out)) {
    media::FillSilence(nb_samples, out);
    return;
  }
  if (!IsEnabled()) {
    media::FillSilence(nb_samples, out);
  }
}

void FFmpegMicrophoneTrack::Stop() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (stopped_.exchange(true, std::memory_order_acq_rel)) return;
  stop_.store(true, std::memory_order_release);
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
  Close();
  buffer_.Reset();
  util::Logger::Debug("[FFmpegMicrophoneTrack] Stopped " + config_.input_uri);
}

void FFmpegMicrophoneTrack::Close() {
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) avformat_close_input(&format_ctx_);
  audio_stream_index_ = -1;
}

void FFmpegMicrophoneTrack::CaptureLoop() {
  while (!stop_.load(std::memory_order_acquire)) {
    // Non-live inputs decode faster than realtime; hold off while ahead.
    if (buffer_.DepthMs() > 120) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }
    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR(EAGAIN)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      continue;
    }
    if (ret < 0) {
      if (!stop_.load(std::memory_order_acquire)) {
        util::Logger::Warn("[FFmpegMicrophoneTrack] capture ended: " + AvErrorString(ret));
      }
      break;
    }
    if (packet_->stream_index != audio_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) continue;
    while (avcodec_receive_frame(codec_ctx_, frame_) == 0) {
      ResampleAndPush(frame_);
      av_frame_unref(frame_);
    }
  }
}

void FFmpegMicrophoneTrack::ResampleAndPush(AVFrame* frame) {
  const int max_out = swr_get_out_samples(swr_ctx_, frame->nb_samples);
  if (max_out <= 0) return;

  media::AudioFrame out;
  out.samples.resize(static_cast<size_t>(max_out) * media::kAudioChannels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out.samples.data())};
  const int converted = swr_convert(swr_ctx_, out_data, max_out,
                                    const_cast<const uint8_t**>(frame->extended_data),
                                    frame->nb_samples);
  if (converted <= 0) return;
  out.nb_samples = converted;
  out.samples.resize(static_cast<size_t>(converted) * media::kAudioChannels);
  buffer_.Push(std::move(out));
}

}  // namespace whipcast::capture
