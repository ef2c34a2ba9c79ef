// Repository: Whipcast
// Component: Reconnect Budget
// Purpose: Consecutive reconnect attempt accounting with cool-down refill.
// Copyright (c) 2025 Whipcast

#include "whipcast/whip/ReconnectBudget.hpp"

namespace whipcast::whip {

ReconnectDecision ReconnectBudget::Evaluate(int64_t now_ms, const runtime::RetryPolicy& policy) {
  if (last_attempt_ms_ && now_ms - *last_attempt_ms_ > policy.cool_down_ms) {
    retry_count_ = 0;
  }

  ReconnectDecision decision;
  if (retry_count_ >= policy.max_retries) {
    return decision;
  }

  ++retry_count_;
  last_attempt_ms_ = now_ms;
  decision.retry = true;
  decision.attempt = retry_count_;
  decision.delay_ms = runtime::BackoffDelayMs(policy, retry_count_);
  return decision;
}

void ReconnectBudget::Reset() {
  retry_count_ = 0;
  last_attempt_ms_.reset();
}

}  // namespace whipcast::whip
