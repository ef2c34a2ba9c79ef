// Repository: Whipcast
// Component: PublishControl gRPC Service Implementation
// Purpose: Implements the PublishControl service as a thin adapter over
//          PublishSessionController.
// Copyright (c) 2025 Whipcast

#include "service/PublishControlService.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <sstream>
#include <utility>

#include "whipcast/params/DiffusionParams.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::service {

using session::ControllerResult;

namespace {

constexpr const char* kApiVersion = "1.0.0";
constexpr auto kEventPollInterval = std::chrono::milliseconds(200);

grpc::Status LoopUnavailable() {
  return grpc::Status(grpc::StatusCode::UNAVAILABLE, "event loop is not running");
}

grpc::Status ToStatus(const ControllerResult& result) {
  if (result.success) return grpc::Status::OK;
  return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, result.message);
}

// Empty text means "no parameters".
bool ParseParamsJson(const std::string& text,
                     std::optional<params::DiffusionParams>& out,
                     std::string& error) {
  if (text.empty()) return true;
  try {
    out = params::ParseDiffusionParams(text);
  } catch (const std::exception& e) {
    error = e.what();
    return false;
  }
  return true;
}

pb::SessionEvent::Kind ToProtoKind(SessionEventKind kind) {
  switch (kind) {
    case SessionEventKind::kReady: return pb::SessionEvent::READY;
    case SessionEventKind::kControllerState: return pb::SessionEvent::CONTROLLER_STATE;
    case SessionEventKind::kConnectionState: return pb::SessionEvent::CONNECTION_STATE;
    case SessionEventKind::kRetry: return pb::SessionEvent::RETRY;
    case SessionEventKind::kRetryExhausted: return pb::SessionEvent::RETRY_EXHAUSTED;
    case SessionEventKind::kWarning: return pb::SessionEvent::WARNING;
    case SessionEventKind::kError: return pb::SessionEvent::ERROR;
  }
  return pb::SessionEvent::WARNING;
}

}  // namespace

PublishControlImpl::PublishControlImpl(runtime::EventLoop& loop,
                                       session::PublishSessionController& controller,
                                       capture::FFmpegCaptureDevices& devices)
    : loop_(loop), controller_(controller), devices_(devices) {
  controller_.OnReady([this](const session::PublishSession& s) {
    SessionEvent event;
    event.kind = SessionEventKind::kReady;
    event.stream_id = s.remote_stream_id;
    event.playback_id = s.output_id;
    event.detail = s.playback_url.value_or("");
    Publish(std::move(event));
  });
  controller_.OnStateChange([this](session::ControllerState state) {
    SessionEvent event;
    event.kind = SessionEventKind::kControllerState;
    event.detail = session::ControllerStateName(state);
    Publish(std::move(event));
  });
  controller_.OnConnectionState([this](whip::ConnectionState state) {
    SessionEvent event;
    event.kind = SessionEventKind::kConnectionState;
    event.detail = whip::ConnectionStateName(state);
    Publish(std::move(event));
  });
  controller_.OnRetry([this](int attempt, int64_t delay_ms) {
    SessionEvent event;
    event.kind = SessionEventKind::kRetry;
    event.attempt = attempt;
    event.delay_ms = delay_ms;
    Publish(std::move(event));
  });
  controller_.OnRetryExhausted([this](const runtime::CallResult& result) {
    SessionEvent event;
    event.kind = SessionEventKind::kRetryExhausted;
    event.detail = result.message;
    Publish(std::move(event));
  });
  controller_.OnWarning([this](const runtime::CallResult& result) {
    SessionEvent event;
    event.kind = SessionEventKind::kWarning;
    event.detail = std::string(runtime::ErrorKindName(result.kind)) + ": " + result.message;
    Publish(std::move(event));
  });
  controller_.OnError([this](const runtime::CallResult& result) {
    SessionEvent event;
    event.kind = SessionEventKind::kError;
    event.detail = std::string(runtime::ErrorKindName(result.kind)) + ": " + result.message;
    Publish(std::move(event));
  });
}

PublishControlImpl::~PublishControlImpl() {
  Shutdown();
  // The controller outlives this object; its teardown must not reach us.
  controller_.ClearCallbacks();
  std::lock_guard<std::mutex> lock(external_mutex_);
  if (external_video_) external_video_->Stop();
  if (external_audio_) external_audio_->Stop();
}

void PublishControlImpl::Shutdown() {
  if (shutting_down_.exchange(true)) return;
  hub_.CloseAll();
}

bool PublishControlImpl::Dispatch(const std::function<void()>& task) {
  return loop_.RunSync(task);
}

void PublishControlImpl::Publish(SessionEvent event) {
  event.timestamp_ms = loop_.NowMs();
  hub_.Publish(event);
}

void PublishControlImpl::RetireExternalVideo(std::shared_ptr<media::IFrameSource> next) {
  std::shared_ptr<media::IFrameSource> previous;
  {
    std::lock_guard<std::mutex> lock(external_mutex_);
    previous = std::exchange(external_video_, std::move(next));
  }
  if (previous && previous != external_video_) previous->Stop();
}

void PublishControlImpl::RetireExternalAudio(std::shared_ptr<media::IAudioTrack> next) {
  std::shared_ptr<media::IAudioTrack> previous;
  {
    std::lock_guard<std::mutex> lock(external_mutex_);
    previous = std::exchange(external_audio_, std::move(next));
  }
  if (previous && previous != external_audio_) previous->Stop();
}

grpc::Status PublishControlImpl::StartSession(grpc::ServerContext* context,
                                              const pb::StartSessionRequest* request,
                                              pb::StartSessionResponse* response) {
  (void)context;
  util::Logger::Info("[StartSession] Request received: params_json_bytes=" +
                     std::to_string(request->params_json().size()));

  std::optional<params::DiffusionParams> initial;
  std::string error;
  if (!ParseParamsJson(request->params_json(), initial, error)) {
    response->set_success(false);
    response->set_message(error);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
  }

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.Start(initial); })) return LoopUnavailable();

  response->set_success(result.success);
  response->set_message(result.success ? "Session starting" : result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::StopSession(grpc::ServerContext* context,
                                             const pb::StopSessionRequest* request,
                                             pb::StopSessionResponse* response) {
  (void)context;
  (void)request;
  util::Logger::Info("[StopSession] Request received");

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.Stop(); })) return LoopUnavailable();

  response->set_success(result.success);
  response->set_message(result.success ? "Session stopped" : result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::UpdateParams(grpc::ServerContext* context,
                                              const pb::UpdateParamsRequest* request,
                                              pb::UpdateParamsResponse* response) {
  (void)context;
  util::Logger::Info("[UpdateParams] Request received: params_json_bytes=" +
                     std::to_string(request->params_json().size()));

  std::optional<params::DiffusionParams> parsed;
  std::string error = "params_json is required";
  if (request->params_json().empty() ||
      !ParseParamsJson(request->params_json(), parsed, error)) {
    response->set_success(false);
    response->set_message(error);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
  }

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.SubmitParams(*parsed); })) {
    return LoopUnavailable();
  }

  response->set_success(result.success);
  response->set_message(result.success ? "Parameters queued" : result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::SetVisibility(grpc::ServerContext* context,
                                               const pb::SetVisibilityRequest* request,
                                               pb::SetVisibilityResponse* response) {
  (void)context;
  util::Logger::Info(std::string("[SetVisibility] Request received: visible=") +
                     (request->visible() ? "true" : "false"));

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.SetVisibility(request->visible()); })) {
    return LoopUnavailable();
  }

  response->set_success(result.success);
  response->set_message(result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::SetMediaSource(grpc::ServerContext* context,
                                                const pb::SetMediaSourceRequest* request,
                                                pb::SetMediaSourceResponse* response) {
  (void)context;
  util::Logger::Info("[SetMediaSource] Request received: kind=" +
                     pb::MediaSourceKind_Name(request->kind()) + ", uri=" + request->uri());

  compositor::MediaSourceSpec spec = compositor::BlankSource{};
  std::shared_ptr<media::IFrameSource> opened;
  switch (request->kind()) {
    case pb::MEDIA_SOURCE_EXTERNAL_STREAM:
    case pb::MEDIA_SOURCE_EXTERNAL_SURFACE: {
      if (request->uri().empty()) {
        response->set_success(false);
        response->set_message("uri is required for external sources");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
      }
      // Opening a URL may block; keep it off the event loop.
      auto device = devices_.OpenVideoUrl(request->uri());
      if (!device.result.success) {
        response->set_success(false);
        response->set_message(device.result.message);
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, device.result.message);
      }
      opened = device.device;
      if (request->kind() == pb::MEDIA_SOURCE_EXTERNAL_STREAM) {
        spec = compositor::ExternalStreamSource{opened};
      } else {
        spec = compositor::ExternalSurfaceSource{opened};
      }
      break;
    }
    case pb::MEDIA_SOURCE_CAMERA: {
      compositor::CameraSource camera;
      camera.facing = request->facing() == pb::CAMERA_FACING_BACK
                          ? capture::CameraFacing::kBack
                          : capture::CameraFacing::kFront;
      camera.mirror = request->mirror();
      spec = camera;
      break;
    }
    default:
      break;
  }

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.SetMediaSource(spec); })) {
    if (opened) opened->Stop();
    return LoopUnavailable();
  }
  RetireExternalVideo(opened);

  response->set_success(result.success);
  response->set_message(result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::SetAudioSource(grpc::ServerContext* context,
                                                const pb::SetAudioSourceRequest* request,
                                                pb::SetAudioSourceResponse* response) {
  (void)context;
  util::Logger::Info("[SetAudioSource] Request received: kind=" +
                     pb::AudioSourceKind_Name(request->kind()) + ", device=" +
                     request->device());

  audio::AudioSourceSpec spec = audio::SilentAudioSource{};
  std::shared_ptr<media::IAudioTrack> opened;
  switch (request->kind()) {
    case pb::AUDIO_SOURCE_EXTERNAL: {
      if (request->device().empty()) {
        response->set_success(false);
        response->set_message("device is required for external audio");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
      }
      auto device = devices_.OpenAudioUrl(request->device());
      if (!device.result.success) {
        response->set_success(false);
        response->set_message(device.result.message);
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, device.result.message);
      }
      opened = device.device;
      spec = audio::ExternalAudioSource{opened};
      break;
    }
    case pb::AUDIO_SOURCE_MICROPHONE: {
      audio::MicrophoneAudioSource mic;
      mic.constraints.device = request->device();
      mic.constraints.echo_cancellation = request->echo_cancellation();
      mic.constraints.noise_suppression = request->noise_suppression();
      spec = mic;
      break;
    }
    default:
      break;
  }

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.SetAudioSource(spec); })) {
    if (opened) opened->Stop();
    return LoopUnavailable();
  }
  RetireExternalAudio(opened);

  response->set_success(result.success);
  response->set_message(result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::SetMicrophoneEnabled(
    grpc::ServerContext* context,
    const pb::SetMicrophoneEnabledRequest* request,
    pb::SetMicrophoneEnabledResponse* response) {
  (void)context;
  util::Logger::Info(std::string("[SetMicrophoneEnabled] Request received: enabled=") +
                     (request->enabled() ? "true" : "false"));

  ControllerResult result;
  if (!Dispatch([&]() { result = controller_.SetMicrophoneEnabled(request->enabled()); })) {
    return LoopUnavailable();
  }

  response->set_success(result.success);
  response->set_message(result.message);
  return ToStatus(result);
}

grpc::Status PublishControlImpl::GetStreamInfo(grpc::ServerContext* context,
                                               const pb::GetStreamInfoRequest* request,
                                               pb::StreamInfo* response) {
  (void)context;
  (void)request;

  session::StreamInfo info;
  if (!Dispatch([&]() { info = controller_.GetStreamInfo(); })) return LoopUnavailable();

  response->set_live(info.live);
  response->set_stream_id(info.stream_id);
  response->set_playback_id(info.playback_id);
  response->set_playback_url(info.playback_url.value_or(""));
  response->set_controller_state(session::ControllerStateName(info.state));
  response->set_connection_state(whip::ConnectionStateName(info.connection));
  return grpc::Status::OK;
}

grpc::Status PublishControlImpl::GetVersion(grpc::ServerContext* context,
                                            const pb::ApiVersionRequest* request,
                                            pb::ApiVersion* response) {
  (void)context;
  (void)request;
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

grpc::Status PublishControlImpl::SubscribeEvents(
    grpc::ServerContext* context,
    const pb::SubscribeEventsRequest* request,
    grpc::ServerWriter<pb::SessionEvent>* writer) {
  (void)request;
  util::Logger::Info("[SubscribeEvents] Subscriber attached");

  if (shutting_down_) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "server is shutting down");
  }

  auto queue = hub_.Subscribe();
  SessionEvent event;
  while (!context->IsCancelled()) {
    if (!queue->WaitPop(event, kEventPollInterval)) {
      if (queue->IsClosed()) break;
      continue;
    }
    pb::SessionEvent out;
    out.set_kind(ToProtoKind(event.kind));
    out.set_timestamp_ms(event.timestamp_ms);
    out.set_detail(event.detail);
    out.set_stream_id(event.stream_id);
    out.set_playback_id(event.playback_id);
    out.set_attempt(event.attempt);
    out.set_delay_ms(event.delay_ms);
    if (!writer->Write(out)) break;
  }
  hub_.Unsubscribe(queue);

  if (queue->Dropped() > 0) {
    std::ostringstream msg;
    msg << "[SubscribeEvents] Subscriber detached, dropped " << queue->Dropped() << " events";
    util::Logger::Warn(msg.str());
  } else {
    util::Logger::Info("[SubscribeEvents] Subscriber detached");
  }
  return grpc::Status::OK;
}

}  // namespace whipcast::service
