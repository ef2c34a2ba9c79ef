// Repository: Whipcast
// Component: Daydream REST Client
// Purpose: ISessionApi over the Daydream streams REST API.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_API_DAYDREAM_API_CLIENT_HPP_
#define WHIPCAST_API_DAYDREAM_API_CLIENT_HPP_

#include <string>

#include <json/json.h>

#include "whipcast/api/ISessionApi.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/IoWorker.hpp"

namespace whipcast::api {

struct ApiConfig {
  std::string base_url = "https://api.daydream.live";
  std::string api_key;
  int connect_timeout_s = 5;
  int read_timeout_s = 15;
};

// Wire format helpers, kept free of I/O.
//   POST  {base}/v1/streams       {"pipeline_id", "pipeline_params"}
//         → {"id", "output_playback_id", "whip_url"}
//   PATCH {base}/v1/streams/{id}  {"params"}
Json::Value BuildCreateSessionBody(const CreateSessionRequest& request);
Json::Value BuildUpdateParamsBody(const params::DiffusionParams& params);

// Fails with kTransientNetwork when the body is not JSON or lacks a field.
CreateSessionResult ParseCreateSessionResponse(const std::string& body);

class DaydreamApiClient : public ISessionApi {
 public:
  DaydreamApiClient(runtime::IoWorker& worker, runtime::IScheduler& scheduler, ApiConfig config);

  void CreateSession(const CreateSessionRequest& request,
                     std::function<void(CreateSessionResult)> done) override;

  void UpdateParams(const std::string& stream_id,
                    const params::DiffusionParams& params,
                    std::function<void(runtime::CallResult)> done) override;

 private:
  CreateSessionResult DoCreate(const std::string& body) const;
  runtime::CallResult DoUpdate(const std::string& stream_id, const std::string& body) const;

  runtime::IoWorker& worker_;
  runtime::IScheduler& scheduler_;
  ApiConfig config_;
};

}  // namespace whipcast::api

#endif  // WHIPCAST_API_DAYDREAM_API_CLIENT_HPP_
