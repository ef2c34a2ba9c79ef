// Repository: Whipcast
// Component: Capture Device Interface
// Purpose: Fallible acquisition of the local camera and microphone.
//          Production: FFmpegCaptureDevices (libavdevice).
//          Tests: FakeCaptureDevices (scripted grants/denials).
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_CAPTURE_ICAPTURE_DEVICES_HPP_
#define WHIPCAST_CAPTURE_ICAPTURE_DEVICES_HPP_

#include <memory>
#include <string>

#include "whipcast/media/IAudioTrack.hpp"
#include "whipcast/media/IFrameSource.hpp"
#include "whipcast/runtime/Errors.hpp"

namespace whipcast::capture {

enum class CameraFacing {
  kFront,  // "user"
  kBack,   // "environment"
};

struct CameraRequest {
  CameraFacing facing = CameraFacing::kFront;
  int width = 1280;
  int height = 720;
  int fps = 24;
};

struct MicrophoneConstraints {
  // Empty selects the platform default input.
  std::string device;
  bool echo_cancellation = true;
  bool noise_suppression = true;
  bool auto_gain_control = true;
};

// result.success implies device != nullptr.
template <typename T>
struct DeviceResult {
  runtime::CallResult result;
  std::shared_ptr<T> device;
};

class ICaptureDevices {
 public:
  virtual ~ICaptureDevices() = default;

  virtual DeviceResult<media::IFrameSource> OpenCamera(const CameraRequest& request) = 0;

  virtual DeviceResult<media::IAudioTrack> OpenMicrophone(
      const MicrophoneConstraints& constraints) = 0;
};

inline const char* CameraFacingName(CameraFacing facing) {
  return facing == CameraFacing::kFront ? "user" : "environment";
}

}  // namespace whipcast::capture

#endif  // WHIPCAST_CAPTURE_ICAPTURE_DEVICES_HPP_
