// Repository: Whipcast
// Component: Fit Mode
// Purpose: Defines how a source frame is fitted into the square compositor
//          surface, and the pure geometry behind it.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_COMPOSITOR_FIT_MODE_HPP_
#define WHIPCAST_COMPOSITOR_FIT_MODE_HPP_

#include <optional>
#include <string>

namespace whipcast::compositor {

enum class FitMode {
  kCover,    // Scale to fill the square, crop the overflow symmetrically (default)
  kContain,  // Scale to fit inside the square, letterbox the remainder
};

const char* FitModeName(FitMode mode);
std::optional<FitMode> ParseFitMode(const std::string& name);

// Where the scaled source lands on the surface, in surface pixels. Origin may
// be negative for cover (the part outside the surface is cropped).
struct DrawRect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

// Integer blit derived from a DrawRect: the source region that is visible
// and the surface region it is scaled into. Both are clipped to their frames.
struct BlitPlan {
  int src_x = 0;
  int src_y = 0;
  int src_w = 0;
  int src_h = 0;
  int dst_x = 0;
  int dst_y = 0;
  int dst_w = 0;
  int dst_h = 0;

  bool Empty() const { return src_w <= 0 || src_h <= 0 || dst_w <= 0 || dst_h <= 0; }
  bool CoversSurface(int dest_size) const {
    return dst_x == 0 && dst_y == 0 && dst_w == dest_size && dst_h == dest_size;
  }
};

// cover: scale = max(dest/src_w, dest/src_h); contain: scale = min(...).
// The result is centered on the surface. Zero or negative dimensions yield
// an empty rect.
DrawRect ComputeDrawRect(int src_w, int src_h, int dest_size, FitMode mode);

BlitPlan PlanBlit(int src_w, int src_h, int dest_size, FitMode mode);

}  // namespace whipcast::compositor

#endif  // WHIPCAST_COMPOSITOR_FIT_MODE_HPP_
