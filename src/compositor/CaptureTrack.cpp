// Repository: Whipcast
// Component: Compositor Capture Track
// Purpose: Video track produced by ticking the compositor at a fixed rate.
// Copyright (c) 2025 Whipcast

#include "whipcast/compositor/CaptureTrack.hpp"

#include "whipcast/compositor/FrameCompositor.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::compositor {

CaptureTrack::CaptureTrack(FrameCompositor& compositor, runtime::IScheduler& scheduler,
                           int fps)
    : compositor_(compositor),
      scheduler_(scheduler),
      fps_(fps > 0 ? fps : 24),
      ticker_(scheduler, fps_) {}

CaptureTrack::~CaptureTrack() {
  Stop();
}

void CaptureTrack::Start() {
  if (stopped_) return;
  start_ms_ = scheduler_.NowMs();
  ticker_.Start([this](int64_t tick_index) { OnTick(tick_index); });
  util::Logger::Debug("[CaptureTrack] ticking at " + std::to_string(fps_) + " fps");
}

int CaptureTrack::Width() const {
  return compositor_.Size();
}

int CaptureTrack::Height() const {
  return compositor_.Size();
}

void CaptureTrack::SetFrameSink(media::FrameSink sink) {
  sink_ = std::move(sink);
}

void CaptureTrack::Stop() {
  if (stopped_) return;
  stopped_ = true;
  ticker_.Stop();
  sink_ = nullptr;
}

void CaptureTrack::OnTick(int64_t tick_index) {
  (void)tick_index;
  const media::VideoFrame& frame = compositor_.Tick();
  if (!sink_) return;
  media::VideoFrame out = frame;
  out.pts_ms = scheduler_.NowMs() - start_ms_;
  ++frames_delivered_;
  sink_(out);
}

}  // namespace whipcast::compositor
