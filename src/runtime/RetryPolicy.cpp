// Repository: Whipcast
// Component: Retry Policy
// Purpose: Value description of a bounded exponential-backoff retry budget.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/RetryPolicy.hpp"

namespace whipcast::runtime {

bool RetryUnlessClientError(const CallResult& result) {
  return !result.success && result.kind != ErrorKind::kClientError;
}

bool RetryPolicy::IsRetryable(const CallResult& result) const {
  if (result.success) return false;
  if (is_retryable) return is_retryable(result);
  return RetryUnlessClientError(result);
}

int64_t BackoffDelayMs(const RetryPolicy& policy, int retry) {
  if (retry < 1) retry = 1;
  // Cap the shift so a misconfigured retry count cannot overflow.
  const int shift = retry - 1 > 20 ? 20 : retry - 1;
  return policy.base_delay_ms * (int64_t{1} << shift);
}

}  // namespace whipcast::runtime
