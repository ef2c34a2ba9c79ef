// Repository: Whipcast
// Component: FFmpeg Capture Devices
// Purpose: libavdevice-backed camera/microphone acquisition.
// Copyright (c) 2025 Whipcast

#include "whipcast/capture/FFmpegCaptureDevices.hpp"

#include "whipcast/capture/FFmpegFrameSource.hpp"
#include "whipcast/capture/FFmpegMicrophoneTrack.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::capture {

FFmpegCaptureDevices::FFmpegCaptureDevices(CaptureDeviceConfig config)
    : config_(std::move(config)) {}

DeviceResult<media::IFrameSource> FFmpegCaptureDevices::OpenCamera(const CameraRequest& request) {
  FrameSourceConfig source;
  source.input_uri =
      request.facing == CameraFacing::kFront ? config_.front_camera : config_.back_camera;
  source.input_format = config_.camera_format;
  source.width = request.width;
  source.height = request.height;
  source.fps = request.fps;

  auto camera = std::make_shared<FFmpegFrameSource>(source);
  DeviceResult<media::IFrameSource> out;
  out.result = camera->Open();
  if (out.result.success) {
    out.device = std::move(camera);
  }
  return out;
}

DeviceResult<media::IAudioTrack> FFmpegCaptureDevices::OpenMicrophone(
    const MicrophoneConstraints& constraints) {
  AudioInputConfig input;
  input.input_uri =
      constraints.device.empty() ? config_.default_microphone : constraints.device;
  input.input_format = config_.microphone_format;
  input.label = "microphone:" + input.input_uri;
  if (constraints.echo_cancellation || constraints.noise_suppression) {
    // Processing is the audio server's job (e.g. a PulseAudio echo-cancel
    // source); the constraint only selects the device.
    util::Logger::Debug("[FFmpegCaptureDevices] echo/noise processing delegated to " +
                        config_.microphone_format);
  }

  auto mic = std::make_shared<FFmpegMicrophoneTrack>(input);
  DeviceResult<media::IAudioTrack> out;
  out.result = mic->Open();
  if (out.result.success) {
    out.device = std::move(mic);
  }
  return out;
}

DeviceResult<media::IFrameSource> FFmpegCaptureDevices::OpenVideoUrl(const std::string& uri) {
  FrameSourceConfig source;
  source.input_uri = uri;
  const bool is_file = uri.find("://") == std::string::npos;
  source.realtime_pacing = is_file;
  source.loop = is_file;

  auto stream = std::make_shared<FFmpegFrameSource>(source);
  DeviceResult<media::IFrameSource> out;
  out.result = stream->Open();
  if (out.result.success) {
    out.device = std::move(stream);
  }
  return out;
}

DeviceResult<media::IAudioTrack> FFmpegCaptureDevices::OpenAudioUrl(const std::string& uri) {
  AudioInputConfig input;
  input.input_uri = uri;
  input.label = "external:" + uri;

  auto track = std::make_shared<FFmpegMicrophoneTrack>(input);
  DeviceResult<media::IAudioTrack> out;
  out.result = track->Open();
  if (out.result.success) {
    out.device = std::move(track);
  }
  return out;
}

}  // namespace whipcast::capture
