// Repository: Whipcast
// Component: Frame Compositor
// Purpose: Owns the square RGBA surface that is published as the video track.
// Copyright (c) 2025 Whipcast

#include "whipcast/compositor/FrameCompositor.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libswscale/swscale.h>
}

#include "whipcast/compositor/CaptureTrack.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::compositor {

namespace {

struct SourceNameVisitor {
  const char* operator()(const BlankSource&) const { return "blank"; }
  const char* operator()(const ExternalStreamSource&) const { return "external_stream"; }
  const char* operator()(const ExternalSurfaceSource&) const { return "external_surface"; }
  const char* operator()(const CameraSource&) const { return "camera"; }
};

}  // namespace

const char* MediaSourceName(const MediaSourceSpec& spec) {
  return std::visit(SourceNameVisitor{}, spec);
}

FrameCompositor::FrameCompositor(capture::ICaptureDevices& devices, CompositorConfig config)
    : devices_(devices), config_(config) {
  surface_.Allocate(config_.size, config_.size);
  FillSurface(config_.blank_color);
}

FrameCompositor::~FrameCompositor() {
  StopOwnedCamera();
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

void FrameCompositor::Configure(int size, FitMode fit) {
  if (size <= 0) {
    util::Logger::Warn("[FrameCompositor] Ignoring non-positive size " + std::to_string(size));
    return;
  }
  config_.size = size;
  config_.fit = fit;
  surface_.Allocate(size, size);
  FillSurface(config_.blank_color);
  util::Logger::Debug("[FrameCompositor] Configured " + std::to_string(size) + "x" +
                      std::to_string(size) + " fit=" + FitModeName(fit));
}

runtime::CallResult FrameCompositor::SetSource(const MediaSourceSpec& spec) {
  StopOwnedCamera();
  source_.reset();
  active_ = spec;

  if (const auto* stream = std::get_if<ExternalStreamSource>(&spec)) {
    source_ = stream->stream;
  } else if (const auto* surface = std::get_if<ExternalSurfaceSource>(&spec)) {
    source_ = surface->surface;
  } else if (const auto* camera = std::get_if<CameraSource>(&spec)) {
    capture::CameraRequest request;
    request.facing = camera->facing;
    request.width = config_.camera_width;
    request.height = config_.camera_height;
    request.fps = config_.camera_fps;
    auto opened = devices_.OpenCamera(request);
    if (!opened.result.success || !opened.device) {
      util::Logger::Warn(std::string("[FrameCompositor] Camera (") +
                         capture::CameraFacingName(camera->facing) +
                         ") unavailable, falling back to blank: " +
                         runtime::Describe(opened.result));
      active_ = BlankSource{};
      FillSurface(config_.blank_color);
      return runtime::CallResult::Failure(runtime::ErrorKind::kDeviceUnavailable,
                                          "camera unavailable: " + opened.result.message);
    }
    source_ = std::move(opened.device);
    source_owned_ = true;
  }

  util::Logger::Info(std::string("[FrameCompositor] Source set to ") + MediaSourceName(active_) +
                     (IsMirroring() ? " (mirrored)" : ""));
  return runtime::CallResult::Ok();
}

void FrameCompositor::ReleaseSource() {
  StopOwnedCamera();
  source_.reset();
  active_ = BlankSource{};
}

void FrameCompositor::StopOwnedCamera() {
  if (source_owned_ && source_) {
    source_->Stop();
    util::Logger::Debug("[FrameCompositor] Stopped owned camera");
  }
  source_owned_ = false;
}

const media::VideoFrame& FrameCompositor::Tick() {
  if (std::holds_alternative<BlankSource>(active_)) {
    FillSurface(config_.blank_color);
    return surface_;
  }

  if (!source_ || !source_->LatestFrame(scratch_) || scratch_.Empty()) {
    ++ticks_skipped_;
    return surface_;
  }

  if (!Draw(scratch_, IsMirroring())) {
    ++ticks_skipped_;
  }
  return surface_;
}

bool FrameCompositor::PushFrame(const media::VideoFrame& frame) {
  if (frame.Empty()) return false;
  return Draw(frame, false);
}

std::shared_ptr<CaptureTrack> FrameCompositor::StartCapture(runtime::IScheduler& scheduler,
                                                            int fps) {
  auto track = std::make_shared<CaptureTrack>(*this, scheduler, fps);
  track->Start();
  return track;
}

void FrameCompositor::FillSurface(const std::array<uint8_t, 4>& color) {
  uint8_t* px = surface_.rgba.data();
  const size_t count = surface_.rgba.size() / 4;
  for (size_t i = 0; i < count; ++i, px += 4) {
    std::memcpy(px, color.data(), 4);
  }
}

bool FrameCompositor::Draw(const media::VideoFrame& src, bool mirror) {
  const BlitPlan plan = PlanBlit(src.width, src.height, config_.size, config_.fit);
  if (plan.Empty()) return false;
  if (src.rgba.size() < static_cast<size_t>(src.Stride()) * static_cast<size_t>(src.height)) {
    return false;
  }

  if (!plan.CoversSurface(config_.size)) {
    FillSurface(config_.clear_color);
  }

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      plan.src_w, plan.src_h, AV_PIX_FMT_RGBA,
      plan.dst_w, plan.dst_h, AV_PIX_FMT_RGBA,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    util::Logger::Error("[FrameCompositor] Failed to create scaler");
    return false;
  }

  const uint8_t* src_planes[1] = {
      src.rgba.data() + static_cast<size_t>(plan.src_y) * src.Stride() +
      static_cast<size_t>(plan.src_x) * 4};
  const int src_stride[1] = {src.Stride()};
  uint8_t* dst_planes[1] = {
      surface_.rgba.data() + static_cast<size_t>(plan.dst_y) * surface_.Stride() +
      static_cast<size_t>(plan.dst_x) * 4};
  const int dst_stride[1] = {surface_.Stride()};
  sws_scale(sws_ctx_, src_planes, src_stride, 0, plan.src_h, dst_planes, dst_stride);

  if (mirror) {
    MirrorRect(plan);
  }
  surface_.pts_ms = src.pts_ms;
  ++frames_drawn_;
  return true;
}

// Flip the drawn rect around its own vertical centerline so an uneven
// letterbox split does not shift the picture.
void FrameCompositor::MirrorRect(const BlitPlan& plan) {
  const size_t stride = static_cast<size_t>(surface_.Stride());
  for (int y = plan.dst_y; y < plan.dst_y + plan.dst_h; ++y) {
    uint8_t* left = surface_.rgba.data() + static_cast<size_t>(y) * stride +
                    static_cast<size_t>(plan.dst_x) * 4;
    uint8_t* right = left + static_cast<size_t>(plan.dst_w - 1) * 4;
    for (; left < right; left += 4, right -= 4) {
      std::swap_ranges(left, left + 4, right);
    }
  }
}

}  // namespace whipcast::compositor
