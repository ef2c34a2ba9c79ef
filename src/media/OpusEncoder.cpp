// Repository: Whipcast
// Component: Opus Encoder
// Purpose: 20 ms house-format PCM packets → Opus (libopus via libavcodec).
// Copyright (c) 2025 Whipcast

#include "whipcast/media/OpusEncoder.hpp"

#include <cstring>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
}

#include "whipcast/util/Logger.hpp"

namespace whipcast::media {

OpusEncoder::OpusEncoder() = default;

OpusEncoder::~OpusEncoder() {
  Close();
}

bool OpusEncoder::Open(int64_t bitrate) {
  Close();

  const AVCodec* codec = avcodec_find_encoder_by_name("libopus");
  if (!codec) {
    util::Logger::Error("[OpusEncoder] libopus not found");
    return false;
  }

  av_log_set_level(AV_LOG_ERROR);

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    util::Logger::Error("[OpusEncoder] Failed to allocate codec context");
    return false;
  }

  codec_ctx_->sample_rate = kAudioSampleRate;
  codec_ctx_->sample_fmt = AV_SAMPLE_FMT_S16;
  codec_ctx_->bit_rate = bitrate;
  codec_ctx_->time_base = AVRational{1, kAudioSampleRate};
  if (av_channel_layout_from_mask(&codec_ctx_->ch_layout, AV_CH_LAYOUT_STEREO) < 0) {
    av_channel_layout_default(&codec_ctx_->ch_layout, kAudioChannels);
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "application", "lowdelay", 0);
  av_dict_set(&opts, "frame_duration", "20", 0);
  int ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, sizeof(errbuf));
    util::Logger::Error(std::string("[OpusEncoder] Failed to open codec: ") + errbuf);
    Close();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    util::Logger::Error("[OpusEncoder] Failed to allocate frame/packet");
    Close();
    return false;
  }
  frame_->format = AV_SAMPLE_FMT_S16;
  frame_->sample_rate = kAudioSampleRate;
  frame_->nb_samples = kAudioPacketSamples;
  av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
  if (av_frame_get_buffer(frame_, 0) < 0) {
    util::Logger::Error("[OpusEncoder] Failed to allocate frame buffer");
    Close();
    return false;
  }

  next_pts_ = 0;
  return true;
}

void OpusEncoder::Close() {
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
}

bool OpusEncoder::Encode(const AudioFrame& frame, std::vector<EncodedPacket>& out) {
  if (!codec_ctx_) return false;
  if (frame.nb_samples != kAudioPacketSamples || frame.channels != kAudioChannels) {
    util::Logger::Warn("[OpusEncoder] Rejected frame with " + std::to_string(frame.nb_samples) +
                       " samples / " + std::to_string(frame.channels) + " channels");
    return false;
  }
  if (av_frame_make_writable(frame_) < 0) return false;

  std::memcpy(frame_->data[0], frame.samples.data(),
              static_cast<size_t>(kAudioPacketSamples) * kAudioChannels * sizeof(int16_t));
  frame_->pts = next_pts_;
  next_pts_ += kAudioPacketSamples;

  int ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) return false;

  while (true) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) return false;
    EncodedPacket pkt;
    pkt.data.assign(packet_->data, packet_->data + packet_->size);
    pkt.pts = packet_->pts;
    pkt.keyframe = true;
    out.push_back(std::move(pkt));
    av_packet_unref(packet_);
  }
  return true;
}

}  // namespace whipcast::media
