// Repository: Whipcast
// Component: Remote Session API Interface
// Purpose: Creates the remote processing session and pushes parameter updates.
//          Production: DaydreamApiClient (REST over cpp-httplib).
//          Tests: FakeSessionApi (held completions).
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_API_ISESSION_API_HPP_
#define WHIPCAST_API_ISESSION_API_HPP_

#include <functional>
#include <optional>
#include <string>

#include "whipcast/params/DiffusionParams.hpp"
#include "whipcast/runtime/Errors.hpp"

namespace whipcast::api {

struct CreateSessionRequest {
  std::string pipeline_id;
  std::optional<params::DiffusionParams> initial_params;
};

// What the remote returns for a new session.
struct SessionDescriptor {
  std::string stream_id;
  std::string output_playback_id;
  std::string whip_url;
};

struct CreateSessionResult {
  runtime::CallResult result;
  SessionDescriptor session;
};

// Completions run on the event loop exactly once.
class ISessionApi {
 public:
  virtual ~ISessionApi() = default;

  virtual void CreateSession(const CreateSessionRequest& request,
                             std::function<void(CreateSessionResult)> done) = 0;

  virtual void UpdateParams(const std::string& stream_id,
                            const params::DiffusionParams& params,
                            std::function<void(runtime::CallResult)> done) = 0;
};

}  // namespace whipcast::api

#endif  // WHIPCAST_API_ISESSION_API_HPP_
