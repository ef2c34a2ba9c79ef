// Repository: Whipcast
// Component: libdatachannel Peer Connection
// Purpose: IPeerConnection over rtc::PeerConnection with H.264/Opus
//          send-only tracks fed by the in-process encoders.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_RTC_PEER_CONNECTION_HPP_
#define WHIPCAST_WHIP_RTC_PEER_CONNECTION_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "whipcast/media/OpusEncoder.hpp"
#include "whipcast/media/VideoEncoder.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/whip/IPeerConnection.hpp"

namespace rtc {
class PeerConnection;
class Track;
class RtpPacketizationConfig;
}  // namespace rtc

namespace whipcast::whip {

// libdatachannel invokes its callbacks on its own threads. Every callback is
// re-posted to the scheduler and dropped once Close() has run.
class RtcPeerConnection : public IPeerConnection,
                          public std::enable_shared_from_this<RtcPeerConnection> {
 public:
  RtcPeerConnection(runtime::IScheduler& scheduler, PeerConfig config);
  ~RtcPeerConnection() override;

  // Creates the underlying rtc::PeerConnection. Throws on library failure.
  void Initialize();

  void OnStateChange(std::function<void(PeerState)> callback) override;
  void OnGatheringComplete(std::function<void()> callback) override;
  runtime::CallResult AddMediaSenders() override;
  runtime::CallResult CreateOffer() override;
  bool IsGatheringComplete() const override;
  std::string LocalDescription() const override;
  runtime::CallResult SetRemoteAnswer(const std::string& sdp) override;
  bool RestartIce() override;
  void SendVideoFrame(const media::VideoFrame& frame) override;
  void SendAudioFrame(const media::AudioFrame& frame) override;
  void Close() override;

 private:
  void Deliver(std::function<void(RtcPeerConnection&)> fn);

  runtime::IScheduler& scheduler_;
  PeerConfig config_;

  std::shared_ptr<rtc::PeerConnection> pc_;
  std::shared_ptr<rtc::Track> video_track_;
  std::shared_ptr<rtc::Track> audio_track_;
  std::shared_ptr<rtc::RtpPacketizationConfig> video_rtp_;
  std::shared_ptr<rtc::RtpPacketizationConfig> audio_rtp_;

  media::VideoEncoder video_encoder_;
  media::OpusEncoder audio_encoder_;
  std::vector<media::EncodedPacket> packets_;

  std::function<void(PeerState)> on_state_;
  std::function<void()> on_gathering_complete_;
  std::atomic<bool> gathering_complete_{false};
  std::atomic<bool> closed_{false};
};

class RtcPeerConnectionFactory : public IPeerConnectionFactory {
 public:
  explicit RtcPeerConnectionFactory(runtime::IScheduler& scheduler);

  // Returns nullptr if libdatachannel refuses to create the connection.
  std::shared_ptr<IPeerConnection> Create(const PeerConfig& config) override;

 private:
  runtime::IScheduler& scheduler_;
};

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_RTC_PEER_CONNECTION_HPP_
