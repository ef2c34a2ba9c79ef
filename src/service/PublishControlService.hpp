// Repository: Whipcast
// Component: PublishControl gRPC Service Implementation
// Purpose: Thin adapter from the PublishControl RPCs onto the session
//          controller, marshalled through the event loop.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_SERVICE_PUBLISH_CONTROL_SERVICE_HPP_
#define WHIPCAST_SERVICE_PUBLISH_CONTROL_SERVICE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>

#include "publish_control.grpc.pb.h"
#include "publish_control.pb.h"
#include "service/SessionEventQueue.hpp"
#include "whipcast/capture/FFmpegCaptureDevices.hpp"
#include "whipcast/runtime/EventLoop.hpp"
#include "whipcast/session/PublishSessionController.hpp"

namespace whipcast::service {

namespace pb = ::whipcast::control::v1;

// PublishControlImpl implements the gRPC service defined in
// publish_control.proto. Every controller call runs on the event loop via
// EventLoop::RunSync; the gRPC threads never touch session state.
//
// Construct before the event loop starts: the constructor registers the
// controller callbacks that feed SubscribeEvents.
class PublishControlImpl final : public pb::PublishControl::Service {
 public:
  PublishControlImpl(runtime::EventLoop& loop,
                     session::PublishSessionController& controller,
                     capture::FFmpegCaptureDevices& devices);
  ~PublishControlImpl() override;

  PublishControlImpl(const PublishControlImpl&) = delete;
  PublishControlImpl& operator=(const PublishControlImpl&) = delete;

  grpc::Status StartSession(grpc::ServerContext* context,
                            const pb::StartSessionRequest* request,
                            pb::StartSessionResponse* response) override;

  grpc::Status StopSession(grpc::ServerContext* context,
                           const pb::StopSessionRequest* request,
                           pb::StopSessionResponse* response) override;

  grpc::Status UpdateParams(grpc::ServerContext* context,
                            const pb::UpdateParamsRequest* request,
                            pb::UpdateParamsResponse* response) override;

  grpc::Status SetVisibility(grpc::ServerContext* context,
                             const pb::SetVisibilityRequest* request,
                             pb::SetVisibilityResponse* response) override;

  grpc::Status SetMediaSource(grpc::ServerContext* context,
                              const pb::SetMediaSourceRequest* request,
                              pb::SetMediaSourceResponse* response) override;

  grpc::Status SetAudioSource(grpc::ServerContext* context,
                              const pb::SetAudioSourceRequest* request,
                              pb::SetAudioSourceResponse* response) override;

  grpc::Status SetMicrophoneEnabled(grpc::ServerContext* context,
                                    const pb::SetMicrophoneEnabledRequest* request,
                                    pb::SetMicrophoneEnabledResponse* response) override;

  grpc::Status GetStreamInfo(grpc::ServerContext* context,
                             const pb::GetStreamInfoRequest* request,
                             pb::StreamInfo* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const pb::ApiVersionRequest* request,
                          pb::ApiVersion* response) override;

  grpc::Status SubscribeEvents(grpc::ServerContext* context,
                               const pb::SubscribeEventsRequest* request,
                               grpc::ServerWriter<pb::SessionEvent>* writer) override;

  // Ends every event stream. Call before shutting the server down.
  void Shutdown();

 private:
  // Runs task on the event loop and waits for it.
  bool Dispatch(const std::function<void()>& task);
  void Publish(SessionEvent event);
  // Stops the previously installed external source once it is replaced.
  void RetireExternalVideo(std::shared_ptr<media::IFrameSource> next);
  void RetireExternalAudio(std::shared_ptr<media::IAudioTrack> next);

  runtime::EventLoop& loop_;
  session::PublishSessionController& controller_;
  capture::FFmpegCaptureDevices& devices_;
  SessionEventHub hub_;
  std::atomic<bool> shutting_down_{false};

  std::mutex external_mutex_;
  std::shared_ptr<media::IFrameSource> external_video_;
  std::shared_ptr<media::IAudioTrack> external_audio_;
};

}  // namespace whipcast::service

#endif  // WHIPCAST_SERVICE_PUBLISH_CONTROL_SERVICE_HPP_
