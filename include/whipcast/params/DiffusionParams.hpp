// Repository: Whipcast
// Component: Diffusion Parameters
// Purpose: The whole-value generation parameter set steered while live, and
//          its JSON wire form.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_PARAMS_DIFFUSION_PARAMS_HPP_
#define WHIPCAST_PARAMS_DIFFUSION_PARAMS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace whipcast::params {

struct ControlNet {
  std::string model_id;
  std::string preprocessor;
  // Free-form object passed through to the preprocessor.
  Json::Value preprocessor_params{Json::objectValue};
  double conditioning_scale = 0.0;
  bool enabled = true;

  bool operator==(const ControlNet& other) const;
};

struct IpAdapter {
  bool enabled = false;
  std::string type = "regular";
  double scale = 0.0;
  std::string weight_type = "linear";
  std::string insightface_model_name = "buffalo_l";

  bool operator==(const IpAdapter& other) const;
};

// Every update replaces the whole value; unset optionals are filled by
// WithDefaults() before anything goes on the wire.
struct DiffusionParams {
  std::optional<std::string> model_id;
  std::string prompt;
  std::optional<std::string> negative_prompt;
  std::optional<int> num_inference_steps;
  std::optional<int64_t> seed;
  std::optional<std::vector<int>> t_index_list;
  std::optional<std::vector<ControlNet>> controlnets;
  std::optional<IpAdapter> ip_adapter;
  std::optional<std::string> ip_adapter_style_image_url;

  // Copy with every unset field replaced by its default. An empty controlnet
  // list counts as unset.
  DiffusionParams WithDefaults() const;

  // Serializes set fields only; call WithDefaults() first for the wire form.
  Json::Value ToJson() const;

  // Throws std::invalid_argument when a present field has the wrong type.
  static DiffusionParams FromJson(const Json::Value& json);

  bool operator==(const DiffusionParams& other) const;
  bool operator!=(const DiffusionParams& other) const { return !(*this == other); }
};

constexpr const char* kDefaultModelId = "stabilityai/sdxl-turbo";
constexpr const char* kDefaultNegativePrompt = "blurry, low quality, flat, 2d, distorted";
constexpr int kDefaultInferenceSteps = 50;
constexpr int64_t kDefaultSeed = 42;

std::vector<int> DefaultTIndexList();
std::vector<ControlNet> DefaultControlNets();

// Parses a JSON document; std::invalid_argument on malformed text.
DiffusionParams ParseDiffusionParams(const std::string& text);

}  // namespace whipcast::params

#endif  // WHIPCAST_PARAMS_DIFFUSION_PARAMS_HPP_
