// Repository: Whipcast
// Component: Fit Mode
// Purpose: Pure cover/contain geometry for the square compositor surface.
// Copyright (c) 2025 Whipcast

#include "whipcast/compositor/FitMode.hpp"

#include <algorithm>
#include <cmath>

namespace whipcast::compositor {

const char* FitModeName(FitMode mode) {
  switch (mode) {
    case FitMode::kCover: return "cover";
    case FitMode::kContain: return "contain";
  }
  return "cover";
}

std::optional<FitMode> ParseFitMode(const std::string& name) {
  if (name == "cover") return FitMode::kCover;
  if (name == "contain") return FitMode::kContain;
  return std::nullopt;
}

DrawRect ComputeDrawRect(int src_w, int src_h, int dest_size, FitMode mode) {
  DrawRect rect;
  if (src_w <= 0 || src_h <= 0 || dest_size <= 0) return rect;

  const double sx = static_cast<double>(dest_size) / src_w;
  const double sy = static_cast<double>(dest_size) / src_h;
  const double scale = mode == FitMode::kCover ? std::max(sx, sy) : std::min(sx, sy);

  rect.width = src_w * scale;
  rect.height = src_h * scale;
  rect.x = (dest_size - rect.width) / 2.0;
  rect.y = (dest_size - rect.height) / 2.0;
  return rect;
}

BlitPlan PlanBlit(int src_w, int src_h, int dest_size, FitMode mode) {
  BlitPlan plan;
  const DrawRect rect = ComputeDrawRect(src_w, src_h, dest_size, mode);
  if (rect.width <= 0.0 || rect.height <= 0.0) return plan;

  const double scale = rect.width / src_w;

  // Horizontal axis.
  if (rect.width >= dest_size) {
    // Overflow: crop the source symmetrically, fill the full surface width.
    int visible = static_cast<int>(std::lround(dest_size / scale));
    visible = std::clamp(visible, 1, src_w);
    plan.src_x = (src_w - visible) / 2;
    plan.src_w = visible;
    plan.dst_x = 0;
    plan.dst_w = dest_size;
  } else {
    plan.src_x = 0;
    plan.src_w = src_w;
    plan.dst_w = std::clamp(static_cast<int>(std::lround(rect.width)), 1, dest_size);
    plan.dst_x = (dest_size - plan.dst_w) / 2;
  }

  // Vertical axis.
  if (rect.height >= dest_size) {
    int visible = static_cast<int>(std::lround(dest_size / scale));
    visible = std::clamp(visible, 1, src_h);
    plan.src_y = (src_h - visible) / 2;
    plan.src_h = visible;
    plan.dst_y = 0;
    plan.dst_h = dest_size;
  } else {
    plan.src_y = 0;
    plan.src_h = src_h;
    plan.dst_h = std::clamp(static_cast<int>(std::lround(rect.height)), 1, dest_size);
    plan.dst_y = (dest_size - plan.dst_h) / 2;
  }

  return plan;
}

}  // namespace whipcast::compositor
