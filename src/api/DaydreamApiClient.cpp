// Repository: Whipcast
// Component: Daydream REST Client
// Purpose: Stream creation and parameter PATCH over cpp-httplib + jsoncpp.
// Copyright (c) 2025 Whipcast

#include "whipcast/api/DaydreamApiClient.hpp"

#include <exception>
#include <memory>
#include <utility>

#include <httplib.h>

#include "whipcast/runtime/HttpUrl.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::api {

using runtime::CallResult;
using runtime::ErrorKind;

namespace {

std::string WriteCompact(const Json::Value& json) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, json);
}

// Base URL path without a trailing slash ("" for a bare origin).
std::string PathPrefix(const runtime::HttpUrl& base) {
  std::string prefix = base.target;
  while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
  return prefix;
}

httplib::Headers AuthHeaders(const std::string& api_key) {
  httplib::Headers headers;
  if (!api_key.empty()) headers.emplace("Authorization", "Bearer " + api_key);
  return headers;
}

}  // namespace

Json::Value BuildCreateSessionBody(const CreateSessionRequest& request) {
  Json::Value body(Json::objectValue);
  body["pipeline_id"] = request.pipeline_id;
  const params::DiffusionParams initial =
      request.initial_params ? *request.initial_params : params::DiffusionParams{};
  body["pipeline_params"] = initial.WithDefaults().ToJson();
  return body;
}

Json::Value BuildUpdateParamsBody(const params::DiffusionParams& params) {
  Json::Value body(Json::objectValue);
  body["params"] = params.WithDefaults().ToJson();
  return body;
}

CreateSessionResult ParseCreateSessionResponse(const std::string& body) {
  CreateSessionResult out;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) ||
      !root.isObject()) {
    out.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                     "create stream: response is not a JSON object");
    return out;
  }
  for (const char* key : {"id", "output_playback_id", "whip_url"}) {
    if (!root[key].isString() || root[key].asString().empty()) {
      out.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                       std::string("create stream: missing '") + key + "'");
      return out;
    }
  }
  out.session.stream_id = root["id"].asString();
  out.session.output_playback_id = root["output_playback_id"].asString();
  out.session.whip_url = root["whip_url"].asString();
  return out;
}

DaydreamApiClient::DaydreamApiClient(runtime::IoWorker& worker,
                                     runtime::IScheduler& scheduler,
                                     ApiConfig config)
    : worker_(worker), scheduler_(scheduler), config_(std::move(config)) {}

void DaydreamApiClient::CreateSession(const CreateSessionRequest& request,
                                      std::function<void(CreateSessionResult)> done) {
  const std::string body = WriteCompact(BuildCreateSessionBody(request));
  worker_.SubmitThen<CreateSessionResult>(
      scheduler_, [this, body]() { return DoCreate(body); }, std::move(done));
}

void DaydreamApiClient::UpdateParams(const std::string& stream_id,
                                     const params::DiffusionParams& params,
                                     std::function<void(CallResult)> done) {
  const std::string body = WriteCompact(BuildUpdateParamsBody(params));
  worker_.SubmitThen<CallResult>(
      scheduler_, [this, stream_id, body]() { return DoUpdate(stream_id, body); },
      std::move(done));
}

CreateSessionResult DaydreamApiClient::DoCreate(const std::string& body) const {
  CreateSessionResult out;
  const auto base = runtime::SplitHttpUrl(config_.base_url);
  if (!base) {
    out.result = CallResult::Failure(ErrorKind::kClientError,
                                     "invalid API base URL: " + config_.base_url);
    return out;
  }

  try {
    httplib::Client client(base->origin);
    client.set_connection_timeout(config_.connect_timeout_s, 0);
    client.set_read_timeout(config_.read_timeout_s, 0);

    const std::string path = PathPrefix(*base) + "/v1/streams";
    util::Logger::Info("[DaydreamApi] POST " + path);
    auto res = client.Post(path, AuthHeaders(config_.api_key), body, "application/json");
    if (!res) {
      out.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                       "create stream: " + httplib::to_string(res.error()));
      return out;
    }
    out.result = runtime::ClassifyHttpStatus(res->status, "create stream");
    if (!out.result.success) {
      util::Logger::Warn("[DaydreamApi] " + runtime::Describe(out.result) + ": " + res->body);
      return out;
    }
    return ParseCreateSessionResponse(res->body);
  } catch (const std::exception& e) {
    out.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                     std::string("create stream: ") + e.what());
    return out;
  }
}

CallResult DaydreamApiClient::DoUpdate(const std::string& stream_id,
                                       const std::string& body) const {
  const auto base = runtime::SplitHttpUrl(config_.base_url);
  if (!base) {
    return CallResult::Failure(ErrorKind::kClientError,
                               "invalid API base URL: " + config_.base_url);
  }

  try {
    httplib::Client client(base->origin);
    client.set_connection_timeout(config_.connect_timeout_s, 0);
    client.set_read_timeout(config_.read_timeout_s, 0);

    const std::string path = PathPrefix(*base) + "/v1/streams/" + stream_id;
    util::Logger::Debug("[DaydreamApi] PATCH " + path);
    auto res = client.Patch(path, AuthHeaders(config_.api_key), body, "application/json");
    if (!res) {
      return CallResult::Failure(ErrorKind::kTransientNetwork,
                                 "update params: " + httplib::to_string(res.error()));
    }
    CallResult result = runtime::ClassifyHttpStatus(res->status, "update params");
    if (!result.success) {
      util::Logger::Warn("[DaydreamApi] " + runtime::Describe(result) + ": " + res->body);
    }
    return result;
  } catch (const std::exception& e) {
    return CallResult::Failure(ErrorKind::kTransientNetwork,
                               std::string("update params: ") + e.what());
  }
}

}  // namespace whipcast::api
