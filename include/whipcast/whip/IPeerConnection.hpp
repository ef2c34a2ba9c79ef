// Repository: Whipcast
// Component: Peer Connection Interface
// Purpose: The slice of a WebRTC peer connection the publisher drives.
//          Production: RtcPeerConnection (libdatachannel).
//          Tests: FakePeerConnection (scripted states and gathering).
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_IPEER_CONNECTION_HPP_
#define WHIPCAST_WHIP_IPEER_CONNECTION_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "whipcast/media/Frames.hpp"
#include "whipcast/runtime/Errors.hpp"

namespace whipcast::whip {

enum class PeerState {
  kNew,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

struct PeerConfig {
  std::vector<std::string> ice_servers;
  // Video sender format; the sender encodes raw compositor frames.
  int video_width = 512;
  int video_height = 512;
  int video_fps = 24;
  int64_t video_bitrate = 1'500'000;
  int64_t audio_bitrate = 64000;
};

// Callbacks are delivered on the event loop.
class IPeerConnection {
 public:
  virtual ~IPeerConnection() = default;

  virtual void OnStateChange(std::function<void(PeerState)> callback) = 0;
  virtual void OnGatheringComplete(std::function<void()> callback) = 0;

  // Adds the send-only H.264 video and Opus audio transceivers.
  virtual runtime::CallResult AddMediaSenders() = 0;

  // Creates the send-only offer, applies it locally and starts ICE gathering.
  virtual runtime::CallResult CreateOffer() = 0;

  virtual bool IsGatheringComplete() const = 0;

  // Local SDP including every candidate gathered so far.
  virtual std::string LocalDescription() const = 0;

  virtual runtime::CallResult SetRemoteAnswer(const std::string& sdp) = 0;

  // Returns false when the implementation cannot restart ICE in place.
  virtual bool RestartIce() = 0;

  // Raw media in; encoding and packetization happen behind the interface.
  virtual void SendVideoFrame(const media::VideoFrame& frame) = 0;
  virtual void SendAudioFrame(const media::AudioFrame& frame) = 0;

  // Idempotent. No callbacks are delivered afterwards.
  virtual void Close() = 0;
};

class IPeerConnectionFactory {
 public:
  virtual ~IPeerConnectionFactory() = default;
  virtual std::shared_ptr<IPeerConnection> Create(const PeerConfig& config) = 0;
};

inline const char* PeerStateName(PeerState state) {
  switch (state) {
    case PeerState::kNew: return "new";
    case PeerState::kConnecting: return "connecting";
    case PeerState::kConnected: return "connected";
    case PeerState::kDisconnected: return "disconnected";
    case PeerState::kFailed: return "failed";
    case PeerState::kClosed: return "closed";
  }
  return "unknown";
}

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_IPEER_CONNECTION_HPP_
