// Repository: Whipcast
// Component: Retry-With-Backoff Combinator
// Purpose: Drives one asynchronous operation through a RetryPolicy. Shared by
//          session creation, WHIP negotiation and parameter pushes.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_RETRY_WITH_BACKOFF_HPP_
#define WHIPCAST_RUNTIME_RETRY_WITH_BACKOFF_HPP_

#include <functional>
#include <string>

#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/RetryPolicy.hpp"

namespace whipcast::runtime {

using Completion = std::function<void(const CallResult&)>;

// One attempt of the operation. Must invoke the completion exactly once,
// either inline or later from a scheduler task.
using AsyncOperation = std::function<void(Completion)>;

// Called before each delayed retry with the 1-based retry number.
using RetryObserver = std::function<void(int retry, int64_t delay_ms, const CallResult& last)>;

// Runs op. On a retryable failure waits BackoffDelayMs(policy, n) and tries
// again, up to policy.max_retries retries. done receives:
//   - the success result,
//   - the first non-retryable failure unchanged,
//   - kRetryExhausted (carrying the last failure's status/message) once the
//     budget is spent.
// Nothing is delivered once token is cancelled.
void RetryWithBackoff(IScheduler& scheduler,
                      const RetryPolicy& policy,
                      const std::string& label,
                      AsyncOperation op,
                      Completion done,
                      CancellationToken token,
                      RetryObserver on_retry = nullptr);

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_RETRY_WITH_BACKOFF_HPP_
