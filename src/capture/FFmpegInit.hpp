// Repository: Whipcast
// Component: FFmpeg Capture Init
// Purpose: One-time libavdevice registration and error formatting shared by
//          the capture sources.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_CAPTURE_FFMPEG_INIT_HPP_
#define WHIPCAST_CAPTURE_FFMPEG_INIT_HPP_

#include <mutex>
#include <string>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace whipcast::capture {

inline void EnsureFFmpegDevicesRegistered() {
  static std::once_flag once;
  std::call_once(once, [] {
    av_log_set_level(AV_LOG_ERROR);
    avdevice_register_all();
  });
}

inline std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace whipcast::capture

#endif  // WHIPCAST_CAPTURE_FFMPEG_INIT_HPP_
