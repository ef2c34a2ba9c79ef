// Repository: Whipcast
// Component: Publish Session Controller
// Purpose: Session lifecycle orchestration.
// Copyright (c) 2025 Whipcast

#include "whipcast/session/PublishSessionController.hpp"

#include <utility>

#include "whipcast/runtime/RetryWithBackoff.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::session {

using runtime::CallResult;
using runtime::CancellationToken;
using runtime::ErrorKind;

namespace {

whip::WhipPublisherConfig MakePublisherConfig(const PublishConfig& config) {
  whip::WhipPublisherConfig out;
  out.peer.ice_servers = config.ice_servers;
  out.peer.video_width = config.compositor.size;
  out.peer.video_height = config.compositor.size;
  out.peer.video_fps = config.fps;
  out.peer.video_bitrate = config.video_bitrate;
  out.peer.audio_bitrate = config.audio_bitrate;
  out.retry = config.whip_retry;
  out.ice_gather_timeout_ms = config.ice_gather_timeout_ms;
  out.grace_period_ms = config.grace_period_ms;
  return out;
}

compositor::CompositorConfig MakeCompositorConfig(const PublishConfig& config) {
  compositor::CompositorConfig out = config.compositor;
  out.camera_fps = config.fps;
  return out;
}

}  // namespace

const char* ControllerStateName(ControllerState state) {
  switch (state) {
    case ControllerState::kNotStarted: return "not_started";
    case ControllerState::kStarting: return "starting";
    case ControllerState::kLive: return "live";
    case ControllerState::kStopping: return "stopping";
    case ControllerState::kStopped: return "stopped";
  }
  return "unknown";
}

PublishSessionController::PublishSessionController(runtime::IScheduler& scheduler,
                                                   api::ISessionApi& api,
                                                   whip::IPeerConnectionFactory& peer_factory,
                                                   whip::IWhipTransport& whip_transport,
                                                   capture::ICaptureDevices& devices,
                                                   PublishConfig config,
                                                   DeviceProfile profile)
    : scheduler_(scheduler),
      api_(api),
      config_(std::move(config)),
      profile_(std::move(profile)),
      compositor_(devices, MakeCompositorConfig(config_)),
      audio_provider_(devices),
      publisher_(scheduler, peer_factory, whip_transport, MakePublisherConfig(config_)),
      param_channel_(scheduler, api, config_.param_retry),
      audio_spec_(audio::SilentAudioSource{}) {
  audio_provider_.OnChange([this](const audio::ResolvedAudioTrack& resolved) {
    if (IsActive()) publisher_.ReplaceAudioTrack(resolved.track);
  });
  audio_provider_.OnWarning([this](const CallResult& result) { Warn(result); });

  publisher_.OnStateChange([this](whip::ConnectionState connection) {
    if (on_connection_) on_connection_(connection);
    if (state_ != ControllerState::kLive) return;
    if (connection == whip::ConnectionState::kConnected && !gate_armed_) {
      ArmParamGate();
    } else if (connection == whip::ConnectionState::kClosed) {
      HandleHardError(CallResult::Failure(ErrorKind::kConnectionDegraded,
                                          "peer connection closed remotely"));
    }
  });
  publisher_.OnRetry([this](int attempt, int64_t delay_ms) {
    if (on_retry_) on_retry_(attempt, delay_ms);
  });
  publisher_.OnFailure([this](const CallResult& result) {
    if (state_ != ControllerState::kLive) return;
    if (result.kind == ErrorKind::kRetryExhausted && on_retry_exhausted_) {
      on_retry_exhausted_(result);
    }
    HandleHardError(result);
  });
  publisher_.OnPlaybackUrl([this](const std::string& url) {
    if (session_) session_->playback_url = url;
  });
  param_channel_.OnResult([this](const CallResult& result) {
    if (!result.success) Warn(result);
  });

  if (PausesWhenHidden(profile_)) {
    util::Logger::Info("[PublishSessionController] Mobile profile: session pauses while hidden");
  }
}

PublishSessionController::~PublishSessionController() {
  Teardown();
}

ControllerResult PublishSessionController::Start(std::optional<params::DiffusionParams> params) {
  if (IsActive()) {
    return ControllerResult::Fail(std::string("session already ") + ControllerStateName(state_));
  }
  if (params) current_params_ = std::move(*params);

  token_ = CancellationToken();
  gate_armed_ = false;
  SetState(ControllerState::kStarting);

  const CallResult source = compositor_.SetSource(media_spec_);
  if (!source.success) Warn(source);
  audio_provider_.Resolve(audio_spec_);

  api::CreateSessionRequest request;
  request.pipeline_id = config_.pipeline_id;
  request.initial_params = current_params_;

  auto descriptor = std::make_shared<api::SessionDescriptor>();
  CancellationToken token = token_;
  runtime::RetryWithBackoff(
      scheduler_, config_.whip_retry, "create session",
      [this, request, descriptor](runtime::Completion attempt_done) {
        api_.CreateSession(request, [descriptor, attempt_done](api::CreateSessionResult created) {
          if (created.result.success) *descriptor = created.session;
          attempt_done(created.result);
        });
      },
      [this, token, descriptor](const CallResult& result) {
        if (token.IsCancelled()) return;
        if (!result.success) {
          FailStart(result);
          return;
        }
        OnSessionCreated(*descriptor);
      },
      token,
      [this](int attempt, int64_t delay_ms, const CallResult&) {
        if (on_retry_) on_retry_(attempt, delay_ms);
      });

  util::Logger::Info("[PublishSessionController] Starting session (pipeline " +
                     config_.pipeline_id + ")");
  return ControllerResult::Ok("starting");
}

void PublishSessionController::OnSessionCreated(const api::SessionDescriptor& descriptor) {
  session_ = PublishSession{descriptor.stream_id, descriptor.stream_id, descriptor.whip_url,
                            descriptor.output_playback_id, std::nullopt};
  util::Logger::Info("[PublishSessionController] Remote session " + descriptor.stream_id +
                     " created");

  param_channel_.Reset();
  param_channel_.BindSession(descriptor.stream_id);
  // Held until the gate opens.
  param_channel_.Submit(current_params_);

  capture_track_ = compositor_.StartCapture(scheduler_, config_.fps);

  CancellationToken token = token_;
  publisher_.Connect(descriptor.whip_url, capture_track_, audio_provider_.Current().track,
                     [this, token](const CallResult& result) {
                       if (token.IsCancelled()) return;
                       OnConnected(result);
                     });
}

void PublishSessionController::OnConnected(const CallResult& result) {
  if (!result.success) {
    FailStart(result);
    return;
  }
  SetState(ControllerState::kLive);
  if (on_ready_ && session_) on_ready_(*session_);
  if (publisher_.state() == whip::ConnectionState::kConnected && !gate_armed_) {
    ArmParamGate();
  }
}

void PublishSessionController::ArmParamGate() {
  gate_armed_ = true;
  CancellationToken token = token_;
  gate_timer_ = scheduler_.ScheduleAfter(config_.settling_window_ms, [this, token]() {
    if (token.IsCancelled()) return;
    gate_timer_ = runtime::kInvalidTimer;
    param_channel_.OpenGate();
  });
}

void PublishSessionController::FailStart(const CallResult& result) {
  util::Logger::Error("[PublishSessionController] Start failed: " + runtime::Describe(result));
  Teardown();
  SetState(ControllerState::kStopped);
  if (on_error_) on_error_(result);
}

void PublishSessionController::HandleHardError(const CallResult& result) {
  // Teardown closes the publisher, which must not happen inside its own callback.
  CancellationToken token = token_;
  scheduler_.Post([this, token, result]() {
    if (token.IsCancelled() || state_ != ControllerState::kLive) return;
    util::Logger::Error("[PublishSessionController] Session lost: " + runtime::Describe(result));
    Teardown();
    SetState(ControllerState::kStopped);
    if (on_error_) on_error_(result);
  });
}

ControllerResult PublishSessionController::Stop() {
  restart_owed_ = false;
  hidden_since_ms_.reset();
  StopInternal("requested");
  return ControllerResult::Ok("stopped");
}

void PublishSessionController::StopInternal(const std::string& reason) {
  if (state_ == ControllerState::kNotStarted || state_ == ControllerState::kStopped) {
    Teardown();
    return;
  }
  util::Logger::Info("[PublishSessionController] Stopping (" + reason + ")");
  SetState(ControllerState::kStopping);
  Teardown();
  SetState(ControllerState::kStopped);
}

void PublishSessionController::Teardown() {
  token_.Cancel();
  if (gate_timer_ != runtime::kInvalidTimer) {
    scheduler_.Cancel(gate_timer_);
    gate_timer_ = runtime::kInvalidTimer;
  }
  gate_armed_ = false;
  param_channel_.Reset();
  publisher_.Close();
  if (capture_track_) {
    capture_track_->Stop();
    capture_track_.reset();
  }
  compositor_.ReleaseSource();
  audio_provider_.Release();
  session_.reset();
}

void PublishSessionController::ClearCallbacks() {
  on_ready_ = nullptr;
  on_state_ = nullptr;
  on_connection_ = nullptr;
  on_retry_ = nullptr;
  on_retry_exhausted_ = nullptr;
  on_warning_ = nullptr;
  on_error_ = nullptr;
}

ControllerResult PublishSessionController::SetVisibility(bool visible) {
  if (!PausesWhenHidden(profile_)) {
    return ControllerResult::Ok("visibility ignored on this device profile");
  }

  if (!visible) {
    if (state_ == ControllerState::kLive) {
      restart_owed_ = true;
      hidden_since_ms_ = scheduler_.NowMs();
      StopInternal("hidden");
      return ControllerResult::Ok("paused while hidden");
    }
    return ControllerResult::Ok();
  }

  if (!restart_owed_) return ControllerResult::Ok();
  restart_owed_ = false;
  const int64_t hidden_ms = hidden_since_ms_ ? scheduler_.NowMs() - *hidden_since_ms_ : 0;
  hidden_since_ms_.reset();

  if (hidden_ms <= config_.visibility_restart_threshold_ms) {
    util::Logger::Info("[PublishSessionController] Visible after " + std::to_string(hidden_ms) +
                       "ms, below restart threshold");
    return ControllerResult::Ok("not restarted");
  }
  if (!config_.auto_start) {
    return ControllerResult::Ok("auto start disabled");
  }
  util::Logger::Info("[PublishSessionController] Visible after " + std::to_string(hidden_ms) +
                     "ms, restarting");
  return Start();
}

ControllerResult PublishSessionController::SetMediaSource(compositor::MediaSourceSpec spec) {
  media_spec_ = std::move(spec);
  if (!IsActive()) return ControllerResult::Ok("applies on start");

  const CallResult result = compositor_.SetSource(media_spec_);
  if (!result.success) {
    Warn(result);
    return ControllerResult::Ok("degraded to blank: " + result.message);
  }
  return ControllerResult::Ok();
}

ControllerResult PublishSessionController::SetAudioSource(audio::AudioSourceSpec spec) {
  audio_spec_ = std::move(spec);
  if (!IsActive()) return ControllerResult::Ok("applies on start");

  const audio::ResolvedAudioTrack& resolved = audio_provider_.Resolve(audio_spec_);
  return ControllerResult::Ok(std::string("audio source ") +
                              audio::AudioProvenanceName(resolved.provenance));
}

ControllerResult PublishSessionController::RequestMicrophone(
    const capture::MicrophoneConstraints& constraints) {
  if (!IsActive()) {
    audio_spec_ = audio::MicrophoneAudioSource{constraints, true};
    return ControllerResult::Ok("applies on start");
  }
  const CallResult result = audio_provider_.RequestMicrophone(constraints);
  if (!result.success) return ControllerResult::Fail(result.message);
  audio_spec_ = audio::MicrophoneAudioSource{constraints, true};
  return ControllerResult::Ok();
}

ControllerResult PublishSessionController::SetMicrophoneEnabled(bool enabled) {
  if (!audio_provider_.SetMicrophoneEnabled(enabled)) {
    return ControllerResult::Fail("no microphone track active");
  }
  return ControllerResult::Ok(enabled ? "microphone enabled" : "microphone muted");
}

ControllerResult PublishSessionController::SubmitParams(params::DiffusionParams params) {
  current_params_ = params;
  if (!session_) return ControllerResult::Ok("applies on start");
  param_channel_.Submit(std::move(params));
  return ControllerResult::Ok();
}

ControllerResult PublishSessionController::PushFrame(const media::VideoFrame& frame) {
  if (!compositor_.PushFrame(frame)) {
    return ControllerResult::Fail("frame not drawable");
  }
  return ControllerResult::Ok();
}

StreamInfo PublishSessionController::GetStreamInfo() const {
  StreamInfo info;
  info.live = state_ == ControllerState::kLive;
  info.state = state_;
  info.connection = publisher_.state();
  if (session_) {
    info.stream_id = session_->session_id;
    info.playback_id = session_->output_id;
    info.playback_url = session_->playback_url;
  }
  return info;
}

void PublishSessionController::SetState(ControllerState next) {
  if (next == state_) return;
  util::Logger::Info(std::string("[PublishSessionController] ") + ControllerStateName(state_) +
                     " -> " + ControllerStateName(next));
  state_ = next;
  if (on_state_) on_state_(state_);
}

void PublishSessionController::Warn(const CallResult& result) {
  util::Logger::Warn("[PublishSessionController] " + runtime::Describe(result));
  if (on_warning_) on_warning_(result);
}

}  // namespace whipcast::session
