// Repository: Whipcast
// Component: Video Track Interface
// Purpose: Push-model frame producer consumed by the publisher's video sender.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_MEDIA_IVIDEO_TRACK_HPP_
#define WHIPCAST_MEDIA_IVIDEO_TRACK_HPP_

#include <functional>

#include "whipcast/media/Frames.hpp"

namespace whipcast::media {

using FrameSink = std::function<void(const VideoFrame&)>;

class IVideoTrack {
 public:
  virtual ~IVideoTrack() = default;

  virtual int Width() const = 0;
  virtual int Height() const = 0;
  virtual int Fps() const = 0;

  // Installs the consumer of produced frames; nullptr detaches.
  virtual void SetFrameSink(FrameSink sink) = 0;

  // Stops producing frames. Idempotent.
  virtual void Stop() = 0;
  virtual bool IsStopped() const = 0;
};

}  // namespace whipcast::media

#endif  // WHIPCAST_MEDIA_IVIDEO_TRACK_HPP_
