// Repository: Whipcast
// Component: WHIP Publisher
// Purpose: Owns the outbound peer connection: WHIP offer/answer, bounded ICE
//          gathering, connection-health handling with ICE restart and
//          exponential-backoff reconnect.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_WHIP_PUBLISHER_HPP_
#define WHIPCAST_WHIP_WHIP_PUBLISHER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "whipcast/media/IAudioTrack.hpp"
#include "whipcast/media/IVideoTrack.hpp"
#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/RetryPolicy.hpp"
#include "whipcast/runtime/RetryWithBackoff.hpp"
#include "whipcast/runtime/TickLoop.hpp"
#include "whipcast/whip/ConnectionState.hpp"
#include "whipcast/whip/IPeerConnection.hpp"
#include "whipcast/whip/IWhipTransport.hpp"
#include "whipcast/whip/ReconnectBudget.hpp"

namespace whipcast::whip {

struct WhipPublisherConfig {
  PeerConfig peer;
  // Used for the initial connect and for reconnection.
  runtime::RetryPolicy retry;
  int64_t ice_gather_timeout_ms = 2000;
  // How long a disconnected peer may try to recover after ICE restart before
  // a full reconnect is evaluated.
  int64_t grace_period_ms = 2000;
};

// WhipPublisher drives one WHIP session at a time.
//
// Negotiation (non-trickle):
//   create peer → add senders → offer → race(gathering complete, timeout)
//   → POST offer → apply answer
//
// Health (after the answer is applied):
//   connected    → Connected; reset the reconnect budget; cancel timers
//   disconnected → Degraded; restart ICE; after the grace period, if still
//                  disconnected, evaluate reconnection
//   failed       → Degraded; evaluate reconnection now
//   closed       → Closed
//
// Reconnection is serialized: at most one evaluation/renegotiation is
// pending at a time. When the budget is spent the publisher enters Failed
// and reports kRetryExhausted exactly once.
//
// Thread Safety: event-loop only. All callbacks run on the event loop.
class WhipPublisher {
 public:
  using ConnectCallback = std::function<void(const runtime::CallResult&)>;
  using StateCallback = std::function<void(ConnectionState)>;
  using RetryCallback = std::function<void(int attempt, int64_t delay_ms)>;
  using FailureCallback = std::function<void(const runtime::CallResult&)>;
  using PlaybackUrlCallback = std::function<void(const std::string&)>;

  WhipPublisher(runtime::IScheduler& scheduler,
                IPeerConnectionFactory& factory,
                IWhipTransport& transport,
                WhipPublisherConfig config);
  ~WhipPublisher();

  WhipPublisher(const WhipPublisher&) = delete;
  WhipPublisher& operator=(const WhipPublisher&) = delete;

  void OnStateChange(StateCallback callback) { on_state_ = std::move(callback); }
  void OnRetry(RetryCallback callback) { on_retry_ = std::move(callback); }
  // Fires once when an established session becomes Failed.
  void OnFailure(FailureCallback callback) { on_failure_ = std::move(callback); }
  void OnPlaybackUrl(PlaybackUrlCallback callback) { on_playback_url_ = std::move(callback); }

  // Negotiates with retry. done receives success once the answer is applied,
  // the ClientError that stopped it, or kRetryExhausted. Rejected with
  // kInvalidState unless Idle, Failed or Closed.
  void Connect(const std::string& whip_url,
               std::shared_ptr<media::IVideoTrack> video,
               std::shared_ptr<media::IAudioTrack> audio,
               ConnectCallback done);

  // Swaps the PCM source of the audio sender in place. No renegotiation.
  void ReplaceAudioTrack(std::shared_ptr<media::IAudioTrack> track);

  // Closes the peer connection and cancels every timer. Idempotent. Tracks
  // are not stopped; they belong to the caller.
  void Close();

  ConnectionState state() const { return state_; }
  const std::optional<std::string>& playback_url() const { return playback_url_; }
  const std::shared_ptr<media::IAudioTrack>& audio_track() const { return audio_; }
  int offers_sent() const { return offers_sent_; }
  int reconnect_count() const { return budget_.retry_count(); }

 private:
  void Negotiate(runtime::Completion done);
  void SendOffer(uint64_t generation, runtime::Completion done);
  void OnPeerState(uint64_t generation, PeerState peer_state);
  void OnGraceExpired();
  void EvaluateReconnect(const std::string& reason);
  void Reconnect();
  void EnterFailed(const runtime::CallResult& result);
  bool Transition(ConnectionEvent event);
  void TearDownPeer();
  void CancelTimers();
  void StartMediaPumps();
  void StopMediaPumps();
  void PumpAudio();

  runtime::IScheduler& scheduler_;
  IPeerConnectionFactory& factory_;
  IWhipTransport& transport_;
  WhipPublisherConfig config_;

  ConnectionState state_ = ConnectionState::kIdle;
  std::string whip_url_;
  std::shared_ptr<media::IVideoTrack> video_;
  std::shared_ptr<media::IAudioTrack> audio_;

  std::shared_ptr<IPeerConnection> pc_;
  uint64_t generation_ = 0;
  bool answer_applied_ = false;
  PeerState last_peer_state_ = PeerState::kNew;

  ReconnectBudget budget_;
  bool reconnect_pending_ = false;
  bool failure_notified_ = false;

  runtime::CancellationToken token_;
  runtime::TimerId gather_timer_ = runtime::kInvalidTimer;
  runtime::TimerId grace_timer_ = runtime::kInvalidTimer;
  runtime::TimerId reconnect_timer_ = runtime::kInvalidTimer;
  runtime::TickLoop audio_pump_;
  media::AudioFrame audio_scratch_;

  std::optional<std::string> playback_url_;
  int offers_sent_ = 0;

  StateCallback on_state_;
  RetryCallback on_retry_;
  FailureCallback on_failure_;
  PlaybackUrlCallback on_playback_url_;
};

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_WHIP_PUBLISHER_HPP_
