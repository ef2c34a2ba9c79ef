// Repository: Whipcast
// Component: Diffusion Parameters
// Purpose: Defaults and jsoncpp (de)serialization.
// Copyright (c) 2025 Whipcast

#include "whipcast/params/DiffusionParams.hpp"

#include <memory>
#include <stdexcept>

namespace whipcast::params {

namespace {

std::string RequireString(const Json::Value& json, const char* key) {
  const Json::Value& v = json[key];
  if (!v.isString()) {
    throw std::invalid_argument(std::string("field '") + key + "' must be a string");
  }
  return v.asString();
}

double RequireNumber(const Json::Value& json, const char* key) {
  const Json::Value& v = json[key];
  if (!v.isNumeric()) {
    throw std::invalid_argument(std::string("field '") + key + "' must be a number");
  }
  return v.asDouble();
}

bool RequireBool(const Json::Value& json, const char* key) {
  const Json::Value& v = json[key];
  if (!v.isBool()) {
    throw std::invalid_argument(std::string("field '") + key + "' must be a boolean");
  }
  return v.asBool();
}

ControlNet ControlNetFromJson(const Json::Value& json) {
  if (!json.isObject()) throw std::invalid_argument("controlnet entries must be objects");
  ControlNet net;
  net.model_id = RequireString(json, "model_id");
  net.preprocessor = RequireString(json, "preprocessor");
  net.conditioning_scale = RequireNumber(json, "conditioning_scale");
  if (json.isMember("enabled")) net.enabled = RequireBool(json, "enabled");
  if (json.isMember("preprocessor_params")) {
    if (!json["preprocessor_params"].isObject()) {
      throw std::invalid_argument("field 'preprocessor_params' must be an object");
    }
    net.preprocessor_params = json["preprocessor_params"];
  }
  return net;
}

Json::Value ControlNetToJson(const ControlNet& net) {
  Json::Value json(Json::objectValue);
  json["model_id"] = net.model_id;
  json["preprocessor"] = net.preprocessor;
  json["preprocessor_params"] = net.preprocessor_params;
  json["conditioning_scale"] = net.conditioning_scale;
  json["enabled"] = net.enabled;
  return json;
}

IpAdapter IpAdapterFromJson(const Json::Value& json) {
  if (!json.isObject()) throw std::invalid_argument("field 'ip_adapter' must be an object");
  IpAdapter adapter;
  if (json.isMember("enabled")) adapter.enabled = RequireBool(json, "enabled");
  if (json.isMember("type")) adapter.type = RequireString(json, "type");
  if (json.isMember("scale")) adapter.scale = RequireNumber(json, "scale");
  if (json.isMember("weight_type")) adapter.weight_type = RequireString(json, "weight_type");
  if (json.isMember("insightface_model_name")) {
    adapter.insightface_model_name = RequireString(json, "insightface_model_name");
  }
  return adapter;
}

Json::Value IpAdapterToJson(const IpAdapter& adapter) {
  Json::Value json(Json::objectValue);
  json["enabled"] = adapter.enabled;
  json["type"] = adapter.type;
  json["scale"] = adapter.scale;
  json["weight_type"] = adapter.weight_type;
  json["insightface_model_name"] = adapter.insightface_model_name;
  return json;
}

}  // namespace

bool ControlNet::operator==(const ControlNet& other) const {
  return model_id == other.model_id && preprocessor == other.preprocessor &&
         preprocessor_params == other.preprocessor_params &&
         conditioning_scale == other.conditioning_scale && enabled == other.enabled;
}

bool IpAdapter::operator==(const IpAdapter& other) const {
  return enabled == other.enabled && type == other.type && scale == other.scale &&
         weight_type == other.weight_type &&
         insightface_model_name == other.insightface_model_name;
}

std::vector<int> DefaultTIndexList() {
  return {6, 12, 18};
}

std::vector<ControlNet> DefaultControlNets() {
  std::vector<ControlNet> nets(3);
  nets[0].model_id = "xinsir/controlnet-depth-sdxl-1.0";
  nets[0].preprocessor = "depth_tensorrt";
  nets[0].conditioning_scale = 0.6;
  nets[1].model_id = "xinsir/controlnet-canny-sdxl-1.0";
  nets[1].preprocessor = "canny";
  nets[1].conditioning_scale = 0.3;
  nets[2].model_id = "xinsir/controlnet-tile-sdxl-1.0";
  nets[2].preprocessor = "feedback";
  nets[2].conditioning_scale = 0.2;
  return nets;
}

DiffusionParams DiffusionParams::WithDefaults() const {
  DiffusionParams out = *this;
  if (!out.model_id) out.model_id = kDefaultModelId;
  if (!out.negative_prompt) out.negative_prompt = kDefaultNegativePrompt;
  if (!out.num_inference_steps) out.num_inference_steps = kDefaultInferenceSteps;
  if (!out.seed) out.seed = kDefaultSeed;
  if (!out.t_index_list) out.t_index_list = DefaultTIndexList();
  if (!out.controlnets || out.controlnets->empty()) out.controlnets = DefaultControlNets();
  if (!out.ip_adapter) out.ip_adapter = IpAdapter{};
  return out;
}

Json::Value DiffusionParams::ToJson() const {
  Json::Value json(Json::objectValue);
  if (model_id) json["model_id"] = *model_id;
  json["prompt"] = prompt;
  if (negative_prompt) json["negative_prompt"] = *negative_prompt;
  if (num_inference_steps) json["num_inference_steps"] = *num_inference_steps;
  if (seed) json["seed"] = static_cast<Json::Int64>(*seed);
  if (t_index_list) {
    Json::Value list(Json::arrayValue);
    for (int t : *t_index_list) list.append(t);
    json["t_index_list"] = list;
  }
  if (controlnets) {
    Json::Value list(Json::arrayValue);
    for (const auto& net : *controlnets) list.append(ControlNetToJson(net));
    json["controlnets"] = list;
  }
  if (ip_adapter) json["ip_adapter"] = IpAdapterToJson(*ip_adapter);
  if (ip_adapter_style_image_url) {
    json["ip_adapter_style_image_url"] = *ip_adapter_style_image_url;
  }
  return json;
}

DiffusionParams DiffusionParams::FromJson(const Json::Value& json) {
  if (!json.isObject()) throw std::invalid_argument("params must be a JSON object");

  DiffusionParams params;
  if (json.isMember("prompt")) params.prompt = RequireString(json, "prompt");
  if (json.isMember("model_id")) params.model_id = RequireString(json, "model_id");
  if (json.isMember("negative_prompt")) {
    params.negative_prompt = RequireString(json, "negative_prompt");
  }
  if (json.isMember("num_inference_steps")) {
    if (!json["num_inference_steps"].isIntegral()) {
      throw std::invalid_argument("field 'num_inference_steps' must be an integer");
    }
    params.num_inference_steps = json["num_inference_steps"].asInt();
  }
  if (json.isMember("seed")) {
    if (!json["seed"].isIntegral()) throw std::invalid_argument("field 'seed' must be an integer");
    params.seed = json["seed"].asInt64();
  }
  if (json.isMember("t_index_list")) {
    const Json::Value& list = json["t_index_list"];
    if (!list.isArray()) throw std::invalid_argument("field 't_index_list' must be an array");
    std::vector<int> values;
    for (const auto& v : list) {
      if (!v.isIntegral()) throw std::invalid_argument("t_index_list entries must be integers");
      values.push_back(v.asInt());
    }
    params.t_index_list = values;
  }
  if (json.isMember("controlnets")) {
    const Json::Value& list = json["controlnets"];
    if (!list.isArray()) throw std::invalid_argument("field 'controlnets' must be an array");
    std::vector<ControlNet> nets;
    for (const auto& v : list) nets.push_back(ControlNetFromJson(v));
    params.controlnets = nets;
  }
  if (json.isMember("ip_adapter")) params.ip_adapter = IpAdapterFromJson(json["ip_adapter"]);
  if (json.isMember("ip_adapter_style_image_url")) {
    params.ip_adapter_style_image_url = RequireString(json, "ip_adapter_style_image_url");
  }
  return params;
}

bool DiffusionParams::operator==(const DiffusionParams& other) const {
  return model_id == other.model_id && prompt == other.prompt &&
         negative_prompt == other.negative_prompt &&
         num_inference_steps == other.num_inference_steps && seed == other.seed &&
         t_index_list == other.t_index_list && controlnets == other.controlnets &&
         ip_adapter == other.ip_adapter &&
         ip_adapter_style_image_url == other.ip_adapter_style_image_url;
}

DiffusionParams ParseDiffusionParams(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw std::invalid_argument("malformed params JSON: " + errors);
  }
  return DiffusionParams::FromJson(root);
}

}  // namespace whipcast::params
