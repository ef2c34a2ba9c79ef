// Repository: Whipcast
// Component: Retry Policy
// Purpose: Value description of a bounded exponential-backoff retry budget.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_RETRY_POLICY_HPP_
#define WHIPCAST_RUNTIME_RETRY_POLICY_HPP_

#include <cstdint>
#include <functional>

#include "whipcast/runtime/Errors.hpp"

namespace whipcast::runtime {

// Decides whether a failed result may be retried.
using RetryClassifier = std::function<bool(const CallResult&)>;

// Retries everything except client errors.
bool RetryUnlessClientError(const CallResult& result);

struct RetryPolicy {
  // Retries after the first attempt. 0 disables retrying.
  int max_retries = 3;
  int64_t base_delay_ms = 1000;
  // A reconnect budget refills when attempts are further apart than this.
  int64_t cool_down_ms = 10000;
  RetryClassifier is_retryable = RetryUnlessClientError;

  bool IsRetryable(const CallResult& result) const;
};

// Delay before retry number `retry` (1-based): base * 2^(retry-1).
int64_t BackoffDelayMs(const RetryPolicy& policy, int retry);

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_RETRY_POLICY_HPP_
