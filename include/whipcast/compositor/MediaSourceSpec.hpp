// Repository: Whipcast
// Component: Media Source Spec
// Purpose: Caller-supplied description of what the compositor draws.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_COMPOSITOR_MEDIA_SOURCE_SPEC_HPP_
#define WHIPCAST_COMPOSITOR_MEDIA_SOURCE_SPEC_HPP_

#include <memory>
#include <variant>

#include "whipcast/capture/ICaptureDevices.hpp"
#include "whipcast/media/IFrameSource.hpp"

namespace whipcast::compositor {

// Constant fill color.
struct BlankSource {};

// A caller-owned decoded video stream. Never stopped by the compositor.
struct ExternalStreamSource {
  std::shared_ptr<media::IFrameSource> stream;
};

// A caller-owned drawing surface. Never stopped by the compositor.
struct ExternalSurfaceSource {
  std::shared_ptr<media::IFrameSource> surface;
};

// The local camera, opened and owned by the compositor.
struct CameraSource {
  capture::CameraFacing facing = capture::CameraFacing::kFront;
  bool mirror = true;
};

using MediaSourceSpec =
    std::variant<BlankSource, ExternalStreamSource, ExternalSurfaceSource, CameraSource>;

const char* MediaSourceName(const MediaSourceSpec& spec);

// Horizontal flip applies only to a front-facing camera with mirror set.
inline bool ShouldMirror(const MediaSourceSpec& spec) {
  const auto* camera = std::get_if<CameraSource>(&spec);
  return camera != nullptr && camera->facing == capture::CameraFacing::kFront &&
         camera->mirror;
}

}  // namespace whipcast::compositor

#endif  // WHIPCAST_COMPOSITOR_MEDIA_SOURCE_SPEC_HPP_
