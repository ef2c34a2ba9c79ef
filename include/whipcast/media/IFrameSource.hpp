// Repository: Whipcast
// Component: Frame Source Interface
// Purpose: Latest-frame access to a video stream, surface or camera.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_IFRAME_SOURCE_HPP_
#define WHIPCAST_MEDIA_IFRAME_SOURCE_HPP_

#include "whipcast/media/Frames.hpp"

namespace whipcast::media {

// Implementations decode on their own thread; LatestFrame() is thread-safe
// and never blocks on I/O.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Copies the most recent frame into out. Returns false when no frame has
  // been decoded yet (the caller keeps its previous output).
  virtual bool LatestFrame(VideoFrame& out) = 0;

  // Stops decoding and releases the device/stream. Idempotent.
  virtual void Stop() = 0;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_IFRAME_SOURCE_HPP_
