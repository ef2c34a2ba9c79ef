// Repository: Whipcast
// Component: Publish Configuration
// Purpose: Defaults, JSON load/save and validation.
// Copyright (c) 2025 Whipcast

#include "whipcast/session/PublishConfig.hpp"

#include <memory>
#include <stdexcept>

namespace whipcast::session {

namespace {

const Json::Value& Section(const Json::Value& root, const char* name) {
  static const Json::Value kEmpty(Json::objectValue);
  if (!root.isMember(name)) return kEmpty;
  const Json::Value& v = root[name];
  if (!v.isObject()) throw std::invalid_argument(std::string("'") + name + "' must be an object");
  return v;
}

void ReadInt(const Json::Value& json, const char* key, int& out) {
  if (!json.isMember(key)) return;
  if (!json[key].isInt()) throw std::invalid_argument(std::string("'") + key + "' must be an integer");
  out = json[key].asInt();
}

void ReadInt64(const Json::Value& json, const char* key, int64_t& out) {
  if (!json.isMember(key)) return;
  if (!json[key].isIntegral()) {
    throw std::invalid_argument(std::string("'") + key + "' must be an integer");
  }
  out = json[key].asInt64();
}

void ReadBool(const Json::Value& json, const char* key, bool& out) {
  if (!json.isMember(key)) return;
  if (!json[key].isBool()) throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
  out = json[key].asBool();
}

void ReadString(const Json::Value& json, const char* key, std::string& out) {
  if (!json.isMember(key)) return;
  if (!json[key].isString()) throw std::invalid_argument(std::string("'") + key + "' must be a string");
  out = json[key].asString();
}

void ReadRetry(const Json::Value& json, runtime::RetryPolicy& policy) {
  if (!json.isMember("retry")) return;
  const Json::Value& retry = json["retry"];
  if (!retry.isObject()) throw std::invalid_argument("'retry' must be an object");
  ReadInt(retry, "max_retries", policy.max_retries);
  ReadInt64(retry, "base_delay_ms", policy.base_delay_ms);
  ReadInt64(retry, "cool_down_ms", policy.cool_down_ms);
}

Json::Value RetryToJson(const runtime::RetryPolicy& policy) {
  Json::Value json(Json::objectValue);
  json["max_retries"] = policy.max_retries;
  json["base_delay_ms"] = static_cast<Json::Int64>(policy.base_delay_ms);
  json["cool_down_ms"] = static_cast<Json::Int64>(policy.cool_down_ms);
  return json;
}

std::string ValidateRetry(const runtime::RetryPolicy& policy, const char* name) {
  if (policy.max_retries < 0) return std::string(name) + ".max_retries must be >= 0";
  if (policy.base_delay_ms <= 0) return std::string(name) + ".base_delay_ms must be > 0";
  if (policy.cool_down_ms < 0) return std::string(name) + ".cool_down_ms must be >= 0";
  return {};
}

}  // namespace

std::vector<std::string> DefaultIceServers() {
  return {
      "stun:stun.l.google.com:19302",
      "stun:stun1.l.google.com:19302",
      "stun:stun.cloudflare.com:3478",
  };
}

runtime::RetryPolicy DefaultParamRetry() {
  runtime::RetryPolicy policy;
  policy.max_retries = 3;
  policy.base_delay_ms = 500;
  return policy;
}

PublishConfig PublishConfig::FromJson(const Json::Value& json) {
  if (!json.isObject()) throw std::invalid_argument("config must be a JSON object");
  PublishConfig config;

  const Json::Value& video = Section(json, "video");
  ReadInt(video, "size", config.compositor.size);
  ReadInt(video, "fps", config.fps);
  ReadBool(video, "mirror", config.mirror);
  ReadInt64(video, "bitrate", config.video_bitrate);
  ReadInt(video, "camera_width", config.compositor.camera_width);
  ReadInt(video, "camera_height", config.compositor.camera_height);
  if (video.isMember("fit")) {
    std::string name;
    ReadString(video, "fit", name);
    const auto fit = compositor::ParseFitMode(name);
    if (!fit) throw std::invalid_argument("unknown fit mode '" + name + "'");
    config.compositor.fit = *fit;
  }
  if (video.isMember("blank_color")) {
    const Json::Value& color = video["blank_color"];
    if (!color.isArray() || color.size() != 4) {
      throw std::invalid_argument("'blank_color' must be [r, g, b, a]");
    }
    for (Json::ArrayIndex i = 0; i < 4; ++i) {
      if (!color[i].isInt() || color[i].asInt() < 0 || color[i].asInt() > 255) {
        throw std::invalid_argument("'blank_color' components must be 0..255");
      }
      config.compositor.blank_color[i] = static_cast<uint8_t>(color[i].asInt());
    }
  }
  config.compositor.camera_fps = config.fps;

  const Json::Value& audio = Section(json, "audio");
  ReadInt64(audio, "bitrate", config.audio_bitrate);

  const Json::Value& whip = Section(json, "whip");
  if (whip.isMember("ice_servers")) {
    const Json::Value& servers = whip["ice_servers"];
    if (!servers.isArray()) throw std::invalid_argument("'ice_servers' must be an array");
    config.ice_servers.clear();
    for (const auto& server : servers) {
      if (!server.isString()) throw std::invalid_argument("'ice_servers' entries must be strings");
      config.ice_servers.push_back(server.asString());
    }
  }
  ReadInt64(whip, "ice_gather_timeout_ms", config.ice_gather_timeout_ms);
  ReadInt64(whip, "grace_period_ms", config.grace_period_ms);
  ReadString(whip, "playback_url_header", config.playback_url_header);
  ReadRetry(whip, config.whip_retry);

  const Json::Value& params = Section(json, "params");
  ReadRetry(params, config.param_retry);
  ReadInt64(params, "settling_window_ms", config.settling_window_ms);

  const Json::Value& session = Section(json, "session");
  ReadString(session, "pipeline_id", config.pipeline_id);
  ReadString(session, "api_base_url", config.api_base_url);
  ReadInt64(session, "visibility_restart_threshold_ms", config.visibility_restart_threshold_ms);
  ReadBool(session, "auto_start", config.auto_start);

  const Json::Value& devices = Section(json, "devices");
  ReadString(devices, "camera_format", config.devices.camera_format);
  ReadString(devices, "front_camera", config.devices.front_camera);
  ReadString(devices, "back_camera", config.devices.back_camera);
  ReadString(devices, "microphone_format", config.devices.microphone_format);
  ReadString(devices, "default_microphone", config.devices.default_microphone);

  return config;
}

Json::Value PublishConfig::ToJson() const {
  Json::Value root(Json::objectValue);

  Json::Value video(Json::objectValue);
  video["size"] = compositor.size;
  video["fps"] = fps;
  video["fit"] = compositor::FitModeName(compositor.fit);
  video["mirror"] = mirror;
  video["bitrate"] = static_cast<Json::Int64>(video_bitrate);
  video["camera_width"] = compositor.camera_width;
  video["camera_height"] = compositor.camera_height;
  Json::Value color(Json::arrayValue);
  for (uint8_t c : compositor.blank_color) color.append(static_cast<int>(c));
  video["blank_color"] = color;
  root["video"] = video;

  Json::Value audio(Json::objectValue);
  audio["bitrate"] = static_cast<Json::Int64>(audio_bitrate);
  root["audio"] = audio;

  Json::Value whip(Json::objectValue);
  Json::Value servers(Json::arrayValue);
  for (const auto& server : ice_servers) servers.append(server);
  whip["ice_servers"] = servers;
  whip["ice_gather_timeout_ms"] = static_cast<Json::Int64>(ice_gather_timeout_ms);
  whip["grace_period_ms"] = static_cast<Json::Int64>(grace_period_ms);
  whip["playback_url_header"] = playback_url_header;
  whip["retry"] = RetryToJson(whip_retry);
  root["whip"] = whip;

  Json::Value params(Json::objectValue);
  params["retry"] = RetryToJson(param_retry);
  params["settling_window_ms"] = static_cast<Json::Int64>(settling_window_ms);
  root["params"] = params;

  Json::Value session(Json::objectValue);
  session["pipeline_id"] = pipeline_id;
  session["api_base_url"] = api_base_url;
  session["visibility_restart_threshold_ms"] =
      static_cast<Json::Int64>(visibility_restart_threshold_ms);
  session["auto_start"] = auto_start;
  root["session"] = session;

  Json::Value dev(Json::objectValue);
  dev["camera_format"] = devices.camera_format;
  dev["front_camera"] = devices.front_camera;
  dev["back_camera"] = devices.back_camera;
  dev["microphone_format"] = devices.microphone_format;
  dev["default_microphone"] = devices.default_microphone;
  root["devices"] = dev;

  return root;
}

std::string PublishConfig::Validate() const {
  if (compositor.size <= 0 || compositor.size % 2 != 0) {
    return "video.size must be a positive even number";
  }
  if (fps <= 0 || fps > 120) return "video.fps must be in 1..120";
  if (video_bitrate <= 0) return "video.bitrate must be > 0";
  if (audio_bitrate <= 0) return "audio.bitrate must be > 0";
  if (ice_gather_timeout_ms <= 0) return "whip.ice_gather_timeout_ms must be > 0";
  if (grace_period_ms < 0) return "whip.grace_period_ms must be >= 0";
  if (settling_window_ms < 0) return "params.settling_window_ms must be >= 0";
  if (visibility_restart_threshold_ms < 0) {
    return "session.visibility_restart_threshold_ms must be >= 0";
  }
  if (pipeline_id.empty()) return "session.pipeline_id must not be empty";
  if (api_base_url.empty()) return "session.api_base_url must not be empty";
  std::string retry = ValidateRetry(whip_retry, "whip.retry");
  if (!retry.empty()) return retry;
  return ValidateRetry(param_retry, "params.retry");
}

PublishConfig ParsePublishConfig(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw std::invalid_argument("malformed config JSON: " + errors);
  }
  return PublishConfig::FromJson(root);
}

}  // namespace whipcast::session
