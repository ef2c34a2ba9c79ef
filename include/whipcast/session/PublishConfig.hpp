// Repository: Whipcast
// Component: Publish Configuration
// Purpose: Every tunable of a publishing session, passed at construction and
//          loaded from a JSON file by the daemon.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_SESSION_PUBLISH_CONFIG_HPP_
#define WHIPCAST_SESSION_PUBLISH_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "whipcast/capture/FFmpegCaptureDevices.hpp"
#include "whipcast/compositor/FrameCompositor.hpp"
#include "whipcast/runtime/RetryPolicy.hpp"

namespace whipcast::session {

constexpr const char* kDefaultPipelineId = "pip_qpUgXycjWF6YMeSL";
constexpr const char* kDefaultApiBaseUrl = "https://api.daydream.live";
constexpr const char* kDefaultPlaybackUrlHeader = "livepeer-playback-url";

std::vector<std::string> DefaultIceServers();

// Parameter pushes back off faster than negotiation.
runtime::RetryPolicy DefaultParamRetry();

struct PublishConfig {
  // Surface size, fit, blank color and requested camera format.
  compositor::CompositorConfig compositor;
  int fps = 24;
  // Default mirror flag for camera sources.
  bool mirror = true;

  std::vector<std::string> ice_servers = DefaultIceServers();
  int64_t ice_gather_timeout_ms = 2000;
  int64_t grace_period_ms = 2000;
  int64_t video_bitrate = 1'500'000;
  int64_t audio_bitrate = 64000;

  // Session creation and WHIP connect/reconnect.
  runtime::RetryPolicy whip_retry;
  runtime::RetryPolicy param_retry = DefaultParamRetry();

  int64_t settling_window_ms = 3000;
  int64_t visibility_restart_threshold_ms = 5000;
  // Restart after a long enough hidden period.
  bool auto_start = true;

  std::string playback_url_header = kDefaultPlaybackUrlHeader;
  std::string pipeline_id = kDefaultPipelineId;
  std::string api_base_url = kDefaultApiBaseUrl;

  capture::CaptureDeviceConfig devices;

  // Missing keys keep their defaults. Throws std::invalid_argument on a
  // present key of the wrong type or an unknown fit mode.
  static PublishConfig FromJson(const Json::Value& json);
  Json::Value ToJson() const;

  // Empty string when valid, otherwise the first problem found.
  std::string Validate() const;
  bool IsValid() const { return Validate().empty(); }
};

// Parses a JSON document into a config; std::invalid_argument on errors.
PublishConfig ParsePublishConfig(const std::string& text);

}  // namespace whipcast::session

#endif  // WHIPCAST_SESSION_PUBLISH_CONFIG_HPP_
