// Repository: Whipcast
// Component: Parameter Update Channel
// Purpose: Serializes remote parameter updates through one coalescing slot.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_PARAMS_PARAM_UPDATE_CHANNEL_HPP_
#define WHIPCAST_PARAMS_PARAM_UPDATE_CHANNEL_HPP_

#include <functional>
#include <optional>
#include <string>

#include "whipcast/api/ISessionApi.hpp"
#include "whipcast/params/DiffusionParams.hpp"
#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/RetryPolicy.hpp"

namespace whipcast::params {

// ParamUpdateChannel holds (pending?, in_flight).
//
// Submit() overwrites pending (last write wins) and schedules a drain. A
// drain runs only when the gate is open, a session is bound, pending is set
// and nothing is in flight; it moves pending into flight and issues the
// update through the retry policy. Completion clears in_flight and schedules
// another drain, so input that arrived during the call goes out next with
// the newest value only.
//
// The gate starts closed. OpenGate() re-queues the most recent submission if
// nothing is pending, so the remote always ends up with the current value.
//
// Thread Safety: event-loop only.
class ParamUpdateChannel {
 public:
  using ResultCallback = std::function<void(const runtime::CallResult&)>;

  ParamUpdateChannel(runtime::IScheduler& scheduler,
                     api::ISessionApi& api,
                     runtime::RetryPolicy policy);
  ~ParamUpdateChannel();

  ParamUpdateChannel(const ParamUpdateChannel&) = delete;
  ParamUpdateChannel& operator=(const ParamUpdateChannel&) = delete;

  void Submit(DiffusionParams params);

  void OpenGate();
  void CloseGate();

  void BindSession(std::string stream_id);

  // Drops pending input, closes the gate, unbinds the session and ignores
  // the completion of any call still in flight.
  void Reset();

  // Called after every finished update (after retries).
  void OnResult(ResultCallback callback) { on_result_ = std::move(callback); }

  bool gate_open() const { return gate_open_; }
  bool in_flight() const { return in_flight_; }
  bool has_pending() const { return pending_.has_value(); }
  const std::optional<DiffusionParams>& latest() const { return latest_; }
  int calls_issued() const { return calls_issued_; }

 private:
  void ScheduleDrain();
  void Drain();

  runtime::IScheduler& scheduler_;
  api::ISessionApi& api_;
  runtime::RetryPolicy policy_;

  std::optional<DiffusionParams> pending_;
  std::optional<DiffusionParams> latest_;
  bool in_flight_ = false;
  bool gate_open_ = false;
  std::string stream_id_;
  int calls_issued_ = 0;

  runtime::CancellationToken token_;
  ResultCallback on_result_;
};

}  // namespace whipcast::params

#endif  // WHIPCAST_PARAMS_PARAM_UPDATE_CHANNEL_HPP_
