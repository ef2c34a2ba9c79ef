// Repository: Whipcast
// Component: Compositor Capture Track
// Purpose: Video track produced by ticking the compositor at a fixed rate.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_COMPOSITOR_CAPTURE_TRACK_HPP_
#define WHIPCAST_COMPOSITOR_CAPTURE_TRACK_HPP_

#include <cstdint>

#include "whipcast/media/IVideoTrack.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/TickLoop.hpp"

namespace whipcast::compositor {

class FrameCompositor;

// Each tick draws the compositor and hands the surface to the sink. The
// track is owned by the session and stopped on teardown; the compositor must
// outlive it.
class CaptureTrack : public media::IVideoTrack {
 public:
  CaptureTrack(FrameCompositor& compositor, runtime::IScheduler& scheduler, int fps);
  ~CaptureTrack() override;

  void Start();

  int Width() const override;
  int Height() const override;
  int Fps() const override { return fps_; }

  void SetFrameSink(media::FrameSink sink) override;
  void Stop() override;
  bool IsStopped() const override { return stopped_; }

  int64_t FramesDelivered() const { return frames_delivered_; }

 private:
  void OnTick(int64_t tick_index);

  FrameCompositor& compositor_;
  runtime::IScheduler& scheduler_;
  int fps_;
  runtime::TickLoop ticker_;
  media::FrameSink sink_;
  bool stopped_ = false;
  int64_t start_ms_ = 0;
  int64_t frames_delivered_ = 0;
};

}  // namespace whipcast::compositor

#endif  // WHIPCAST_COMPOSITOR_CAPTURE_TRACK_HPP_
