// Repository: Whipcast
// Component: Reconnect Budget
// Purpose: Counts consecutive reconnect attempts against a RetryPolicy and
//          refills after a quiet cool-down.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_RECONNECT_BUDGET_HPP_
#define WHIPCAST_WHIP_RECONNECT_BUDGET_HPP_

#include <cstdint>
#include <optional>

#include "whipcast/runtime/RetryPolicy.hpp"

namespace whipcast::whip {

struct ReconnectDecision {
  bool retry = false;
  int attempt = 0;        // 1-based, valid when retry
  int64_t delay_ms = 0;   // base * 2^(attempt-1), valid when retry
};

class ReconnectBudget {
 public:
  // If more than cool_down_ms passed since the last attempt, the counter
  // restarts at zero. Then: attempts left → consume one and return the
  // backoff; none left → retry=false.
  ReconnectDecision Evaluate(int64_t now_ms, const runtime::RetryPolicy& policy);

  // Called on a successful connection.
  void Reset();

  int retry_count() const { return retry_count_; }
  std::optional<int64_t> last_attempt_ms() const { return last_attempt_ms_; }

 private:
  int retry_count_ = 0;
  std::optional<int64_t> last_attempt_ms_;
};

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_RECONNECT_BUDGET_HPP_
