// Repository: Whipcast
// Component: Publish Session Controller
// Purpose: Owns one publishing session end to end: remote session creation,
//          compositor/audio wiring into the WHIP publisher, the parameter
//          gate, start/stop and visibility-driven pause/resume.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_SESSION_PUBLISH_SESSION_CONTROLLER_HPP_
#define WHIPCAST_SESSION_PUBLISH_SESSION_CONTROLLER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "whipcast/api/ISessionApi.hpp"
#include "whipcast/audio/AudioTrackProvider.hpp"
#include "whipcast/capture/ICaptureDevices.hpp"
#include "whipcast/compositor/CaptureTrack.hpp"
#include "whipcast/compositor/FrameCompositor.hpp"
#include "whipcast/params/DiffusionParams.hpp"
#include "whipcast/params/ParamUpdateChannel.hpp"
#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/session/DeviceProfile.hpp"
#include "whipcast/session/PublishConfig.hpp"
#include "whipcast/whip/IPeerConnection.hpp"
#include "whipcast/whip/IWhipTransport.hpp"
#include "whipcast/whip/WhipPublisher.hpp"

namespace whipcast::session {

enum class ControllerState {
  kNotStarted,
  kStarting,
  kLive,
  kStopping,
  kStopped,
};

const char* ControllerStateName(ControllerState state);

// Result of a controller command.
struct ControllerResult {
  bool success = true;
  std::string message;

  static ControllerResult Ok(std::string message = {}) { return {true, std::move(message)}; }
  static ControllerResult Fail(std::string message) { return {false, std::move(message)}; }
};

struct PublishSession {
  std::string session_id;
  std::string remote_stream_id;
  std::string whip_url;
  std::string output_id;
  // Filled from the WHIP answer when the endpoint advertises one.
  std::optional<std::string> playback_url;
};

struct StreamInfo {
  bool live = false;
  std::string stream_id;
  std::string playback_id;
  std::optional<std::string> playback_url;
  ControllerState state = ControllerState::kNotStarted;
  whip::ConnectionState connection = whip::ConnectionState::kIdle;
};

// PublishSessionController
//
//   NotStarted → Starting → Live → Stopping → Stopped
//   Live → Stopped on a hard error (reconnect budget exhausted, remote close)
//
// Start() is asynchronous: it returns once the attempt is under way and
// reports the outcome through OnReady() or OnError(). Stop() is synchronous,
// idempotent and safe from any state.
//
// Thread Safety: event-loop only. Callbacks run on the event loop.
class PublishSessionController {
 public:
  using ReadyCallback = std::function<void(const PublishSession&)>;
  using StateCallback = std::function<void(ControllerState)>;
  using ConnectionCallback = std::function<void(whip::ConnectionState)>;
  using RetryCallback = std::function<void(int attempt, int64_t delay_ms)>;
  using ResultCallback = std::function<void(const runtime::CallResult&)>;

  PublishSessionController(runtime::IScheduler& scheduler,
                           api::ISessionApi& api,
                           whip::IPeerConnectionFactory& peer_factory,
                           whip::IWhipTransport& whip_transport,
                           capture::ICaptureDevices& devices,
                           PublishConfig config,
                           DeviceProfile profile);
  ~PublishSessionController();

  PublishSessionController(const PublishSessionController&) = delete;
  PublishSessionController& operator=(const PublishSessionController&) = delete;

  void OnReady(ReadyCallback callback) { on_ready_ = std::move(callback); }
  void OnStateChange(StateCallback callback) { on_state_ = std::move(callback); }
  void OnConnectionState(ConnectionCallback callback) { on_connection_ = std::move(callback); }
  void OnRetry(RetryCallback callback) { on_retry_ = std::move(callback); }
  void OnRetryExhausted(ResultCallback callback) { on_retry_exhausted_ = std::move(callback); }
  void OnWarning(ResultCallback callback) { on_warning_ = std::move(callback); }
  void OnError(ResultCallback callback) { on_error_ = std::move(callback); }

  // Drops every registered callback. Owners of the callbacks call this before
  // they go away; later teardown then reports nothing.
  void ClearCallbacks();

  // params replaces the current parameter set when given.
  ControllerResult Start(std::optional<params::DiffusionParams> params = std::nullopt);
  ControllerResult Stop();

  // Only acts on a mobile profile without always_on.
  ControllerResult SetVisibility(bool visible);

  ControllerResult SetMediaSource(compositor::MediaSourceSpec spec);

  // Re-resolves the audio chain and hot-swaps the published track.
  ControllerResult SetAudioSource(audio::AudioSourceSpec spec);
  ControllerResult RequestMicrophone(const capture::MicrophoneConstraints& constraints);
  ControllerResult SetMicrophoneEnabled(bool enabled);

  ControllerResult SubmitParams(params::DiffusionParams params);

  ControllerResult PushFrame(const media::VideoFrame& frame);

  StreamInfo GetStreamInfo() const;

  ControllerState state() const { return state_; }
  const std::optional<PublishSession>& session() const { return session_; }
  const params::DiffusionParams& current_params() const { return current_params_; }
  bool restart_owed() const { return restart_owed_; }

  compositor::FrameCompositor& compositor() { return compositor_; }
  audio::AudioTrackProvider& audio_provider() { return audio_provider_; }
  whip::WhipPublisher& publisher() { return publisher_; }
  params::ParamUpdateChannel& param_channel() { return param_channel_; }

 private:
  bool IsActive() const {
    return state_ == ControllerState::kStarting || state_ == ControllerState::kLive;
  }
  void SetState(ControllerState next);
  void OnSessionCreated(const api::SessionDescriptor& descriptor);
  void OnConnected(const runtime::CallResult& result);
  void ArmParamGate();
  void FailStart(const runtime::CallResult& result);
  void HandleHardError(const runtime::CallResult& result);
  void StopInternal(const std::string& reason);
  void Teardown();
  void Warn(const runtime::CallResult& result);

  runtime::IScheduler& scheduler_;
  api::ISessionApi& api_;
  PublishConfig config_;
  DeviceProfile profile_;

  compositor::FrameCompositor compositor_;
  audio::AudioTrackProvider audio_provider_;
  whip::WhipPublisher publisher_;
  params::ParamUpdateChannel param_channel_;

  ControllerState state_ = ControllerState::kNotStarted;
  std::optional<PublishSession> session_;
  std::shared_ptr<compositor::CaptureTrack> capture_track_;

  compositor::MediaSourceSpec media_spec_;
  audio::AudioSourceSpec audio_spec_;
  params::DiffusionParams current_params_;

  runtime::CancellationToken token_;
  runtime::TimerId gate_timer_ = runtime::kInvalidTimer;
  bool gate_armed_ = false;

  bool restart_owed_ = false;
  std::optional<int64_t> hidden_since_ms_;

  ReadyCallback on_ready_;
  StateCallback on_state_;
  ConnectionCallback on_connection_;
  RetryCallback on_retry_;
  ResultCallback on_retry_exhausted_;
  ResultCallback on_warning_;
  ResultCallback on_error_;
};

}  // namespace whipcast::session

#endif  // WHIPCAST_SESSION_PUBLISH_SESSION_CONTROLLER_HPP_
