// Repository: Whipcast
// Component: libdatachannel Peer Connection
// Purpose: Send-only H.264 + Opus peer connection for WHIP.
// Copyright (c) 2025 Whipcast

#include "whipcast/whip/RtcPeerConnection.hpp"

#include <exception>
#include <random>

#include <rtc/rtc.hpp>

#include "whipcast/util/Logger.hpp"

namespace whipcast::whip {

using runtime::CallResult;
using runtime::ErrorKind;

namespace {

constexpr int kVideoPayloadType = 96;
constexpr int kAudioPayloadType = 111;
constexpr uint32_t kVideoClockRate = 90000;
constexpr uint32_t kAudioClockRate = 48000;
constexpr const char* kCname = "whipcast";

uint32_t RandomSsrc() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis(1, UINT32_MAX);
  return dis(gen);
}

PeerState MapState(rtc::PeerConnection::State state) {
  switch (state) {
    case rtc::PeerConnection::State::New: return PeerState::kNew;
    case rtc::PeerConnection::State::Connecting: return PeerState::kConnecting;
    case rtc::PeerConnection::State::Connected: return PeerState::kConnected;
    case rtc::PeerConnection::State::Disconnected: return PeerState::kDisconnected;
    case rtc::PeerConnection::State::Failed: return PeerState::kFailed;
    case rtc::PeerConnection::State::Closed: return PeerState::kClosed;
  }
  return PeerState::kFailed;
}

}  // namespace

RtcPeerConnection::RtcPeerConnection(runtime::IScheduler& scheduler, PeerConfig config)
    : scheduler_(scheduler), config_(std::move(config)) {}

RtcPeerConnection::~RtcPeerConnection() {
  Close();
}

void RtcPeerConnection::Initialize() {
  rtc::Configuration rtc_config;
  for (const auto& server : config_.ice_servers) {
    rtc_config.iceServers.emplace_back(server);
  }
  rtc_config.disableAutoNegotiation = true;

  pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

  std::weak_ptr<RtcPeerConnection> weak = weak_from_this();
  pc_->onStateChange([weak](rtc::PeerConnection::State state) {
    if (auto self = weak.lock()) {
      const PeerState mapped = MapState(state);
      self->Deliver([mapped](RtcPeerConnection& pc) {
        if (pc.on_state_) pc.on_state_(mapped);
      });
    }
  });
  pc_->onGatheringStateChange([weak](rtc::PeerConnection::GatheringState state) {
    if (state != rtc::PeerConnection::GatheringState::Complete) return;
    if (auto self = weak.lock()) {
      self->gathering_complete_ = true;
      self->Deliver([](RtcPeerConnection& pc) {
        if (pc.on_gathering_complete_) pc.on_gathering_complete_();
      });
    }
  });
}

void RtcPeerConnection::Deliver(std::function<void(RtcPeerConnection&)> fn) {
  if (closed_) return;
  std::weak_ptr<RtcPeerConnection> weak = weak_from_this();
  scheduler_.Post([weak, fn = std::move(fn)]() {
    auto self = weak.lock();
    if (!self || self->closed_) return;
    fn(*self);
  });
}

void RtcPeerConnection::OnStateChange(std::function<void(PeerState)> callback) {
  on_state_ = std::move(callback);
}

void RtcPeerConnection::OnGatheringComplete(std::function<void()> callback) {
  on_gathering_complete_ = std::move(callback);
}

CallResult RtcPeerConnection::AddMediaSenders() {
  media::VideoEncoderConfig video_config;
  video_config.width = config_.video_width;
  video_config.height = config_.video_height;
  video_config.fps = config_.video_fps;
  video_config.bitrate = config_.video_bitrate;
  if (!video_encoder_.Open(video_config)) {
    return CallResult::Failure(ErrorKind::kTransientNetwork, "H.264 encoder unavailable");
  }
  if (!audio_encoder_.Open(config_.audio_bitrate)) {
    return CallResult::Failure(ErrorKind::kTransientNetwork, "Opus encoder unavailable");
  }

  try {
    const uint32_t video_ssrc = RandomSsrc();
    rtc::Description::Video video("video", rtc::Description::Direction::SendOnly);
    video.addH264Codec(kVideoPayloadType);
    video.addSSRC(video_ssrc, kCname, "whipcast-stream", "video");
    video_track_ = pc_->addTrack(video);

    video_rtp_ = std::make_shared<rtc::RtpPacketizationConfig>(
        video_ssrc, kCname, kVideoPayloadType, kVideoClockRate);
    auto video_packetizer = std::make_shared<rtc::H264RtpPacketizer>(
        rtc::NalUnit::Separator::StartSequence, video_rtp_);
    video_packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(video_rtp_));
    video_packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
    std::weak_ptr<RtcPeerConnection> weak = weak_from_this();
    video_packetizer->addToChain(std::make_shared<rtc::PliHandler>([weak]() {
      if (auto self = weak.lock()) {
        self->Deliver([](RtcPeerConnection& pc) { pc.video_encoder_.RequestKeyframe(); });
      }
    }));
    video_track_->setMediaHandler(video_packetizer);

    const uint32_t audio_ssrc = RandomSsrc();
    rtc::Description::Audio audio("audio", rtc::Description::Direction::SendOnly);
    audio.addOpusCodec(kAudioPayloadType);
    audio.addSSRC(audio_ssrc, kCname, "whipcast-stream", "audio");
    audio_track_ = pc_->addTrack(audio);

    audio_rtp_ = std::make_shared<rtc::RtpPacketizationConfig>(
        audio_ssrc, kCname, kAudioPayloadType, kAudioClockRate);
    auto audio_packetizer = std::make_shared<rtc::OpusRtpPacketizer>(audio_rtp_);
    audio_packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(audio_rtp_));
    audio_track_->setMediaHandler(audio_packetizer);
  } catch (const std::exception& e) {
    return CallResult::Failure(ErrorKind::kTransientNetwork,
                               std::string("adding media senders failed: ") + e.what());
  }
  return CallResult::Ok();
}

CallResult RtcPeerConnection::CreateOffer() {
  try {
    pc_->setLocalDescription(rtc::Description::Type::Offer);
  } catch (const std::exception& e) {
    return CallResult::Failure(ErrorKind::kTransientNetwork,
                               std::string("creating offer failed: ") + e.what());
  }
  if (pc_->gatheringState() == rtc::PeerConnection::GatheringState::Complete) {
    gathering_complete_ = true;
  }
  return CallResult::Ok();
}

bool RtcPeerConnection::IsGatheringComplete() const {
  return gathering_complete_;
}

std::string RtcPeerConnection::LocalDescription() const {
  if (!pc_) return {};
  auto description = pc_->localDescription();
  return description ? std::string(*description) : std::string();
}

CallResult RtcPeerConnection::SetRemoteAnswer(const std::string& sdp) {
  try {
    pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
  } catch (const std::exception& e) {
    return CallResult::Failure(ErrorKind::kTransientNetwork, e.what());
  }
  return CallResult::Ok();
}

bool RtcPeerConnection::RestartIce() {
  // libdatachannel has no in-place ICE restart; recovery falls through to
  // the publisher's renegotiation.
  return false;
}

void RtcPeerConnection::SendVideoFrame(const media::VideoFrame& frame) {
  if (closed_ || !video_track_ || !video_track_->isOpen()) return;
  packets_.clear();
  if (!video_encoder_.Encode(frame, packets_)) return;
  for (const auto& packet : packets_) {
    const auto* data = reinterpret_cast<const std::byte*>(packet.data.data());
    try {
      video_track_->sendFrame(rtc::binary(data, data + packet.data.size()),
                              rtc::FrameInfo(static_cast<uint32_t>(packet.pts)));
    } catch (const std::exception& e) {
      util::Logger::Warn(std::string("[RtcPeerConnection] Video send failed: ") + e.what());
      return;
    }
  }
}

void RtcPeerConnection::SendAudioFrame(const media::AudioFrame& frame) {
  if (closed_ || !audio_track_ || !audio_track_->isOpen()) return;
  packets_.clear();
  if (!audio_encoder_.Encode(frame, packets_)) return;
  for (const auto& packet : packets_) {
    const auto* data = reinterpret_cast<const std::byte*>(packet.data.data());
    try {
      audio_track_->sendFrame(rtc::binary(data, data + packet.data.size()),
                              rtc::FrameInfo(static_cast<uint32_t>(packet.pts)));
    } catch (const std::exception& e) {
      util::Logger::Warn(std::string("[RtcPeerConnection] Audio send failed: ") + e.what());
      return;
    }
  }
}

void RtcPeerConnection::Close() {
  if (closed_.exchange(true)) return;
  on_state_ = nullptr;
  on_gathering_complete_ = nullptr;
  if (pc_) {
    try {
      pc_->close();
    } catch (const std::exception& e) {
      util::Logger::Warn(std::string("[RtcPeerConnection] Close failed: ") + e.what());
    }
  }
  video_encoder_.Close();
  audio_encoder_.Close();
}

RtcPeerConnectionFactory::RtcPeerConnectionFactory(runtime::IScheduler& scheduler)
    : scheduler_(scheduler) {}

std::shared_ptr<IPeerConnection> RtcPeerConnectionFactory::Create(const PeerConfig& config) {
  auto pc = std::make_shared<RtcPeerConnection>(scheduler_, config);
  try {
    pc->Initialize();
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[RtcPeerConnection] Create failed: ") + e.what());
    return nullptr;
  }
  return pc;
}

}  // namespace whipcast::whip
