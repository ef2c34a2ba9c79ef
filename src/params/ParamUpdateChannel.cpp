// Repository: Whipcast
// Component: Parameter Update Channel
// Purpose: Coalescing single-flight parameter push.
// Copyright (c) 2025 Whipcast

#include "whipcast/params/ParamUpdateChannel.hpp"

#include <utility>

#include "whipcast/runtime/RetryWithBackoff.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::params {

using runtime::CallResult;
using runtime::CancellationToken;

ParamUpdateChannel::ParamUpdateChannel(runtime::IScheduler& scheduler,
                                       api::ISessionApi& api,
                                       runtime::RetryPolicy policy)
    : scheduler_(scheduler), api_(api), policy_(std::move(policy)) {}

ParamUpdateChannel::~ParamUpdateChannel() {
  token_.Cancel();
}

void ParamUpdateChannel::Submit(DiffusionParams params) {
  latest_ = params;
  pending_ = std::move(params);
  ScheduleDrain();
}

void ParamUpdateChannel::OpenGate() {
  if (gate_open_) return;
  gate_open_ = true;
  if (!pending_ && latest_) pending_ = latest_;
  util::Logger::Info("[ParamUpdateChannel] Gate open");
  ScheduleDrain();
}

void ParamUpdateChannel::CloseGate() {
  gate_open_ = false;
}

void ParamUpdateChannel::BindSession(std::string stream_id) {
  stream_id_ = std::move(stream_id);
  ScheduleDrain();
}

void ParamUpdateChannel::Reset() {
  token_.Cancel();
  token_ = CancellationToken();
  pending_.reset();
  latest_.reset();
  in_flight_ = false;
  gate_open_ = false;
  stream_id_.clear();
}

void ParamUpdateChannel::ScheduleDrain() {
  CancellationToken token = token_;
  scheduler_.Post([this, token]() {
    if (token.IsCancelled()) return;
    Drain();
  });
}

void ParamUpdateChannel::Drain() {
  if (!gate_open_ || !pending_ || in_flight_ || stream_id_.empty()) return;

  DiffusionParams snapshot = std::move(*pending_);
  pending_.reset();
  in_flight_ = true;
  ++calls_issued_;

  const std::string stream_id = stream_id_;
  CancellationToken token = token_;
  runtime::RetryWithBackoff(
      scheduler_, policy_, "param update",
      [this, stream_id, snapshot](runtime::Completion attempt_done) {
        api_.UpdateParams(stream_id, snapshot,
                          [attempt_done](CallResult result) { attempt_done(result); });
      },
      [this, token](const CallResult& result) {
        if (token.IsCancelled()) return;
        in_flight_ = false;
        if (!result.success) {
          util::Logger::Warn("[ParamUpdateChannel] Update dropped: " + runtime::Describe(result));
        }
        if (on_result_) on_result_(result);
        ScheduleDrain();
      },
      token);
}

}  // namespace whipcast::params
