// Repository: Whipcast
// Component: Frame Compositor
// Purpose: Owns the square RGBA surface that is published as the video track
//          and copies the configured source into it once per tick.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_COMPOSITOR_FRAME_COMPOSITOR_HPP_
#define WHIPCAST_COMPOSITOR_FRAME_COMPOSITOR_HPP_

#include <array>
#include <cstdint>
#include <memory>

#include "whipcast/capture/ICaptureDevices.hpp"
#include "whipcast/compositor/FitMode.hpp"
#include "whipcast/compositor/MediaSourceSpec.hpp"
#include "whipcast/media/Frames.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/IScheduler.hpp"

struct SwsContext;

namespace whipcast::compositor {

class CaptureTrack;

struct CompositorConfig {
  int size = 512;
  FitMode fit = FitMode::kCover;
  std::array<uint8_t, 4> blank_color{0, 0, 0, 255};
  // Letterbox fill for contain.
  std::array<uint8_t, 4> clear_color{0, 0, 0, 255};
  // Requested camera capture format.
  int camera_width = 1280;
  int camera_height = 720;
  int camera_fps = 24;
};

// FrameCompositor draws one source into a size × size surface.
//
// Per tick:
//   Blank            → fill with blank_color
//   stream / surface → latest decoded frame, fitted (cover/contain)
//   Camera           → same, mirrored for a front camera with mirror set
// A source with no frame ready, or a zero-sized frame, leaves the surface
// untouched for that tick. Output is always exactly size × size.
//
// The compositor owns the camera it opens and stops it on source change and
// ReleaseSource(). External sources are never stopped.
//
// Thread Safety: event-loop only.
class FrameCompositor {
 public:
  FrameCompositor(capture::ICaptureDevices& devices, CompositorConfig config);
  ~FrameCompositor();

  FrameCompositor(const FrameCompositor&) = delete;
  FrameCompositor& operator=(const FrameCompositor&) = delete;

  // Resizes the surface (cleared) and sets the fit for subsequent ticks.
  void Configure(int size, FitMode fit);

  // Switches the drawn source. A camera that cannot be opened degrades to
  // Blank and returns kDeviceUnavailable.
  runtime::CallResult SetSource(const MediaSourceSpec& spec);

  // Stops an owned camera and reverts to Blank. Idempotent.
  void ReleaseSource();

  // Draws the current source and returns the surface.
  const media::VideoFrame& Tick();

  // Draws frame directly with the configured fit, independent of the source.
  bool PushFrame(const media::VideoFrame& frame);

  // A frame-producing track that ticks this compositor at fps on scheduler.
  std::shared_ptr<CaptureTrack> StartCapture(runtime::IScheduler& scheduler, int fps);

  const media::VideoFrame& Surface() const { return surface_; }
  const MediaSourceSpec& ActiveSource() const { return active_; }
  int Size() const { return config_.size; }
  FitMode Fit() const { return config_.fit; }
  bool IsMirroring() const { return ShouldMirror(active_); }

  uint64_t FramesDrawn() const { return frames_drawn_; }
  uint64_t TicksSkipped() const { return ticks_skipped_; }

 private:
  void FillSurface(const std::array<uint8_t, 4>& color);
  bool Draw(const media::VideoFrame& src, bool mirror);
  void MirrorRect(const BlitPlan& plan);
  void StopOwnedCamera();

  capture::ICaptureDevices& devices_;
  CompositorConfig config_;
  media::VideoFrame surface_;
  media::VideoFrame scratch_;

  MediaSourceSpec active_ = BlankSource{};
  // Frame source for non-blank specs (external or owned camera).
  std::shared_ptr<media::IFrameSource> source_;
  bool source_owned_ = false;

  SwsContext* sws_ctx_ = nullptr;
  uint64_t frames_drawn_ = 0;
  uint64_t ticks_skipped_ = 0;
};

}  // namespace whipcast::compositor

#endif  // WHIPCAST_COMPOSITOR_FRAME_COMPOSITOR_HPP_
