// Repository: Whipcast
// Component: WHIP Publisher
// Purpose: WHIP negotiation, ICE restart and bounded reconnect.
// Copyright (c) 2025 Whipcast

#include "whipcast/whip/WhipPublisher.hpp"

#include <sstream>
#include <utility>

#include "whipcast/util/Logger.hpp"

namespace whipcast::whip {

using runtime::CallResult;
using runtime::CancellationToken;
using runtime::Completion;
using runtime::ErrorKind;

namespace {

// 20 ms packets.
constexpr int64_t kAudioPacketsPerSecond = 1000 / media::kAudioPacketMs;

}  // namespace

WhipPublisher::WhipPublisher(runtime::IScheduler& scheduler,
                             IPeerConnectionFactory& factory,
                             IWhipTransport& transport,
                             WhipPublisherConfig config)
    : scheduler_(scheduler),
      factory_(factory),
      transport_(transport),
      config_(std::move(config)),
      audio_pump_(scheduler, kAudioPacketsPerSecond) {}

WhipPublisher::~WhipPublisher() {
  Close();
}

void WhipPublisher::Connect(const std::string& whip_url,
                            std::shared_ptr<media::IVideoTrack> video,
                            std::shared_ptr<media::IAudioTrack> audio,
                            ConnectCallback done) {
  if (state_ != ConnectionState::kIdle && state_ != ConnectionState::kFailed &&
      state_ != ConnectionState::kClosed) {
    done(CallResult::Failure(ErrorKind::kInvalidState,
                             std::string("connect while ") + ConnectionStateName(state_)));
    return;
  }

  token_ = CancellationToken();
  budget_.Reset();
  reconnect_pending_ = false;
  failure_notified_ = false;
  answer_applied_ = false;
  playback_url_.reset();
  state_ = ConnectionState::kIdle;

  whip_url_ = whip_url;
  video_ = std::move(video);
  audio_ = std::move(audio);

  util::Logger::Info("[WhipPublisher] Connecting to " + whip_url_);
  Transition(ConnectionEvent::kNegotiate);
  StartMediaPumps();

  CancellationToken token = token_;
  runtime::RetryWithBackoff(
      scheduler_, config_.retry, "WHIP negotiation",
      [this](Completion attempt_done) { Negotiate(std::move(attempt_done)); },
      [this, token, done = std::move(done)](const CallResult& result) {
        if (token.IsCancelled()) return;
        if (result.success) {
          done(result);
          return;
        }
        util::Logger::Error("[WhipPublisher] Initial negotiation failed: " +
                            runtime::Describe(result));
        StopMediaPumps();
        TearDownPeer();
        Transition(ConnectionEvent::kRetryExhausted);
        done(result);
      },
      token,
      [this](int retry, int64_t delay_ms, const CallResult&) {
        if (on_retry_) on_retry_(retry, delay_ms);
      });
}

void WhipPublisher::Negotiate(Completion done) {
  TearDownPeer();
  const uint64_t generation = ++generation_;
  answer_applied_ = false;
  last_peer_state_ = PeerState::kNew;

  pc_ = factory_.Create(config_.peer);
  if (!pc_) {
    done(CallResult::Failure(ErrorKind::kTransientNetwork, "peer connection unavailable"));
    return;
  }

  CancellationToken token = token_;
  pc_->OnStateChange([this, token, generation](PeerState peer_state) {
    if (token.IsCancelled()) return;
    OnPeerState(generation, peer_state);
  });

  CallResult result = pc_->AddMediaSenders();
  if (result.success) result = pc_->CreateOffer();
  if (!result.success) {
    TearDownPeer();
    // Local setup problems are not the remote's fault; let the policy retry.
    done(CallResult::Failure(ErrorKind::kTransientNetwork, result.message));
    return;
  }

  // Whichever comes first sends the offer: gathering completion or timeout.
  auto offer_sent = std::make_shared<bool>(false);
  auto send = [this, token, generation, offer_sent, done](const char* trigger) {
    if (token.IsCancelled() || generation != generation_ || *offer_sent) return;
    *offer_sent = true;
    if (gather_timer_ != runtime::kInvalidTimer) {
      scheduler_.Cancel(gather_timer_);
      gather_timer_ = runtime::kInvalidTimer;
    }
    util::Logger::Debug(std::string("[WhipPublisher] Sending offer after ") + trigger);
    SendOffer(generation, done);
  };

  if (pc_->IsGatheringComplete()) {
    send("gathering complete");
    return;
  }
  pc_->OnGatheringComplete([send]() { send("gathering complete"); });
  gather_timer_ = scheduler_.ScheduleAfter(config_.ice_gather_timeout_ms, [this, send]() {
    gather_timer_ = runtime::kInvalidTimer;
    util::Logger::Warn("[WhipPublisher] ICE gathering timed out after " +
                       std::to_string(config_.ice_gather_timeout_ms) +
                       "ms, sending partial offer");
    send("gather timeout");
  });
}

void WhipPublisher::SendOffer(uint64_t generation, Completion done) {
  const std::string offer = pc_->LocalDescription();
  ++offers_sent_;

  CancellationToken token = token_;
  transport_.PostOffer(whip_url_, offer,
                       [this, token, generation, done = std::move(done)](WhipAnswer answer) {
    if (token.IsCancelled() || generation != generation_) return;

    if (!answer.result.success) {
      TearDownPeer();
      done(answer.result);
      return;
    }

    const CallResult applied = pc_->SetRemoteAnswer(answer.answer_sdp);
    if (!applied.success) {
      TearDownPeer();
      done(CallResult::Failure(ErrorKind::kTransientNetwork,
                               "remote answer rejected: " + applied.message));
      return;
    }
    answer_applied_ = true;

    if (answer.playback_url && !answer.playback_url->empty()) {
      playback_url_ = answer.playback_url;
      if (on_playback_url_) on_playback_url_(*playback_url_);
    }
    util::Logger::Info("[WhipPublisher] Answer applied");
    done(CallResult::Ok());
  });
}

void WhipPublisher::OnPeerState(uint64_t generation, PeerState peer_state) {
  if (generation != generation_) return;
  last_peer_state_ = peer_state;
  util::Logger::Debug(std::string("[WhipPublisher] Peer state ") + PeerStateName(peer_state));

  switch (peer_state) {
    case PeerState::kConnected:
      if (grace_timer_ != runtime::kInvalidTimer) {
        scheduler_.Cancel(grace_timer_);
        grace_timer_ = runtime::kInvalidTimer;
      }
      if (reconnect_timer_ != runtime::kInvalidTimer) {
        scheduler_.Cancel(reconnect_timer_);
        reconnect_timer_ = runtime::kInvalidTimer;
      }
      reconnect_pending_ = false;
      budget_.Reset();
      Transition(ConnectionEvent::kPeerConnected);
      return;

    case PeerState::kDisconnected:
      // A pending reconnect replaces this peer anyway.
      if (!answer_applied_ || reconnect_pending_) return;
      Transition(ConnectionEvent::kPeerDisconnected);
      if (!pc_->RestartIce()) {
        util::Logger::Warn("[WhipPublisher] ICE restart unavailable, waiting out grace period");
      }
      if (grace_timer_ == runtime::kInvalidTimer) {
        CancellationToken token = token_;
        grace_timer_ = scheduler_.ScheduleAfter(config_.grace_period_ms, [this, token]() {
          if (token.IsCancelled()) return;
          grace_timer_ = runtime::kInvalidTimer;
          OnGraceExpired();
        });
      }
      return;

    case PeerState::kFailed:
      if (!answer_applied_ || reconnect_pending_) return;
      if (grace_timer_ != runtime::kInvalidTimer) {
        scheduler_.Cancel(grace_timer_);
        grace_timer_ = runtime::kInvalidTimer;
      }
      Transition(ConnectionEvent::kPeerFailed);
      EvaluateReconnect("peer connection failed");
      return;

    case PeerState::kClosed:
      if (!answer_applied_) return;
      util::Logger::Warn("[WhipPublisher] Peer connection closed remotely");
      CancelTimers();
      StopMediaPumps();
      Transition(ConnectionEvent::kClose);
      return;

    case PeerState::kNew:
    case PeerState::kConnecting:
      return;
  }
}

void WhipPublisher::OnGraceExpired() {
  if (last_peer_state_ != PeerState::kDisconnected) return;
  EvaluateReconnect("still disconnected after " + std::to_string(config_.grace_period_ms) +
                    "ms grace");
}

void WhipPublisher::EvaluateReconnect(const std::string& reason) {
  if (state_ == ConnectionState::kFailed || state_ == ConnectionState::kClosed) return;
  if (reconnect_pending_) {
    util::Logger::Debug("[WhipPublisher] Reconnect already pending, ignoring: " + reason);
    return;
  }

  const ReconnectDecision decision = budget_.Evaluate(scheduler_.NowMs(), config_.retry);
  if (!decision.retry) {
    std::ostringstream msg;
    msg << "reconnect budget exhausted after " << budget_.retry_count()
        << " attempts (" << reason << ")";
    EnterFailed(CallResult::Failure(ErrorKind::kRetryExhausted, msg.str()));
    return;
  }

  reconnect_pending_ = true;
  Transition(ConnectionEvent::kReconnectScheduled);
  util::Logger::Warn("[WhipPublisher] " + reason + "; reconnect " +
                     std::to_string(decision.attempt) + "/" +
                     std::to_string(config_.retry.max_retries) + " in " +
                     std::to_string(decision.delay_ms) + "ms");
  if (on_retry_) on_retry_(decision.attempt, decision.delay_ms);

  CancellationToken token = token_;
  reconnect_timer_ = scheduler_.ScheduleAfter(decision.delay_ms, [this, token]() {
    if (token.IsCancelled()) return;
    reconnect_timer_ = runtime::kInvalidTimer;
    Reconnect();
  });
}

void WhipPublisher::Reconnect() {
  Transition(ConnectionEvent::kNegotiate);
  CancellationToken token = token_;
  Negotiate([this, token](const CallResult& result) {
    if (token.IsCancelled()) return;
    reconnect_pending_ = false;
    if (result.success) return;  // Connected arrives as a peer event
    if (result.kind == ErrorKind::kClientError) {
      EnterFailed(result);
      return;
    }
    EvaluateReconnect("renegotiation failed: " + result.message);
  });
}

void WhipPublisher::EnterFailed(const CallResult& result) {
  if (failure_notified_) return;
  failure_notified_ = true;
  util::Logger::Error("[WhipPublisher] Giving up: " + runtime::Describe(result));
  CancelTimers();
  StopMediaPumps();
  TearDownPeer();
  reconnect_pending_ = false;
  Transition(ConnectionEvent::kRetryExhausted);
  if (on_failure_) on_failure_(result);
}

bool WhipPublisher::Transition(ConnectionEvent event) {
  const auto next = NextConnectionState(state_, event);
  if (!next) {
    util::Logger::Debug(std::string("[WhipPublisher] Ignoring ") + ConnectionEventName(event) +
                        " in " + ConnectionStateName(state_));
    return false;
  }
  if (*next == state_) return true;
  util::Logger::Info(std::string("[WhipPublisher] ") + ConnectionStateName(state_) + " -> " +
                     ConnectionStateName(*next));
  state_ = *next;
  if (on_state_) on_state_(state_);
  return true;
}

void WhipPublisher::ReplaceAudioTrack(std::shared_ptr<media::IAudioTrack> track) {
  util::Logger::Info("[WhipPublisher] Audio track replaced with " +
                     (track ? track->Label() : std::string("none")));
  audio_ = std::move(track);
}

void WhipPublisher::Close() {
  token_.Cancel();
  CancelTimers();
  StopMediaPumps();
  TearDownPeer();
  reconnect_pending_ = false;
  if (state_ != ConnectionState::kClosed) {
    Transition(ConnectionEvent::kClose);
  }
}

void WhipPublisher::TearDownPeer() {
  if (gather_timer_ != runtime::kInvalidTimer) {
    scheduler_.Cancel(gather_timer_);
    gather_timer_ = runtime::kInvalidTimer;
  }
  if (pc_) {
    pc_->Close();
    pc_.reset();
  }
  answer_applied_ = false;
}

void WhipPublisher::CancelTimers() {
  for (runtime::TimerId* timer : {&gather_timer_, &grace_timer_, &reconnect_timer_}) {
    if (*timer != runtime::kInvalidTimer) {
      scheduler_.Cancel(*timer);
      *timer = runtime::kInvalidTimer;
    }
  }
}

void WhipPublisher::StartMediaPumps() {
  if (video_) {
    CancellationToken token = token_;
    video_->SetFrameSink([this, token](const media::VideoFrame& frame) {
      if (token.IsCancelled()) return;
      if (pc_ && state_ == ConnectionState::kConnected) pc_->SendVideoFrame(frame);
    });
  }
  audio_pump_.Start([this](int64_t) { PumpAudio(); });
}

void WhipPublisher::StopMediaPumps() {
  audio_pump_.Stop();
  if (video_) video_->SetFrameSink(nullptr);
}

void WhipPublisher::PumpAudio() {
  if (!audio_) return;
  // Always drain so a live microphone does not accumulate latency while the
  // peer is not connected.
  audio_->ReadSamples(media::kAudioPacketSamples, audio_scratch_);
  if (pc_ && state_ == ConnectionState::kConnected) pc_->SendAudioFrame(audio_scratch_);
}

}  // namespace whipcast::whip
