// Repository: Whipcast
// Component: FFmpeg Capture Devices
// Purpose: libavdevice-backed camera/microphone acquisition, plus helpers for
//          caller-supplied media URLs.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_CAPTURE_FFMPEG_CAPTURE_DEVICES_HPP_
#define WHIPCAST_CAPTURE_FFMPEG_CAPTURE_DEVICES_HPP_

#include <string>

#include "whipcast/capture/ICaptureDevices.hpp"

namespace whipcast::capture {

struct CaptureDeviceConfig {
  std::string camera_format = "v4l2";
  std::string front_camera = "/dev/video0";
  std::string back_camera = "/dev/video1";
  std::string microphone_format = "pulse";
  std::string default_microphone = "default";
};

class FFmpegCaptureDevices : public ICaptureDevices {
 public:
  explicit FFmpegCaptureDevices(CaptureDeviceConfig config);

  DeviceResult<media::IFrameSource> OpenCamera(const CameraRequest& request) override;
  DeviceResult<media::IAudioTrack> OpenMicrophone(
      const MicrophoneConstraints& constraints) override;

  // Decodes any FFmpeg-readable URL as an external video stream, looping files.
  DeviceResult<media::IFrameSource> OpenVideoUrl(const std::string& uri);

  // Decodes any FFmpeg-readable URL as an external audio track.
  DeviceResult<media::IAudioTrack> OpenAudioUrl(const std::string& uri);

 private:
  CaptureDeviceConfig config_;
};

}  // namespace whipcast::capture

#endif  // WHIPCAST_CAPTURE_FFMPEG_CAPTURE_DEVICES_HPP_
