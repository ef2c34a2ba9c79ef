// Repository: Whipcast
// Component: Retry Contract Tests
// Purpose: Verify exponential backoff, retry classification, exhaustion and
//          the cooling reconnect budget.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include <vector>

#include "support/ManualScheduler.hpp"
#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/Errors.hpp"
#include "whipcast/runtime/RetryPolicy.hpp"
#include "whipcast/runtime/RetryWithBackoff.hpp"
#include "whipcast/whip/ReconnectBudget.hpp"

namespace whipcast::runtime::testing {
namespace {

RetryPolicy MakePolicy(int max_retries, int64_t base_delay_ms) {
  RetryPolicy policy;
  policy.max_retries = max_retries;
  policy.base_delay_ms = base_delay_ms;
  return policy;
}

// Test delays double from the base
TEST(RetryPolicyTest, BackoffDoublesFromBase) {
  const RetryPolicy policy = MakePolicy(3, 1000);
  EXPECT_EQ(BackoffDelayMs(policy, 1), 1000);
  EXPECT_EQ(BackoffDelayMs(policy, 2), 2000);
  EXPECT_EQ(BackoffDelayMs(policy, 3), 4000);
}

// Test client errors are never retryable by default
TEST(RetryPolicyTest, ClientErrorsAreNotRetryable) {
  const RetryPolicy policy;
  EXPECT_FALSE(policy.IsRetryable(CallResult::Ok()));
  EXPECT_FALSE(policy.IsRetryable(CallResult::Failure(ErrorKind::kClientError, "400", 400)));
  EXPECT_TRUE(policy.IsRetryable(CallResult::Failure(ErrorKind::kTransientNetwork, "503", 503)));
}

// Test HTTP status classification
TEST(RetryPolicyTest, ClassifiesHttpStatus) {
  EXPECT_TRUE(ClassifyHttpStatus(201, "x").success);
  EXPECT_EQ(ClassifyHttpStatus(404, "x").kind, ErrorKind::kClientError);
  EXPECT_EQ(ClassifyHttpStatus(404, "x").http_status, 404);
  EXPECT_EQ(ClassifyHttpStatus(500, "x").kind, ErrorKind::kTransientNetwork);
  EXPECT_EQ(ClassifyHttpStatus(302, "x").kind, ErrorKind::kTransientNetwork);
}

// Test a transient failure followed by success waits exactly one base delay
TEST(RetryWithBackoffTest, RetriesTransientFailureThenSucceeds) {
  ManualScheduler scheduler;
  int attempts = 0;
  std::vector<int64_t> attempt_times;
  std::vector<CallResult> results;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        ++attempts;
        attempt_times.push_back(scheduler.NowMs());
        if (attempts == 1) {
          done(CallResult::Failure(ErrorKind::kTransientNetwork, "500", 500));
        } else {
          done(CallResult::Ok());
        }
      },
      [&](const CallResult& result) { results.push_back(result); }, CancellationToken());

  scheduler.AdvanceBy(999);
  EXPECT_EQ(attempts, 1);
  scheduler.AdvanceBy(1);
  EXPECT_EQ(attempts, 2);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_EQ(attempt_times, (std::vector<int64_t>{0, 1000}));
}

// Test a client error is returned at once without retrying
TEST(RetryWithBackoffTest, ClientErrorStopsImmediately) {
  ManualScheduler scheduler;
  int attempts = 0;
  std::vector<CallResult> results;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        ++attempts;
        done(CallResult::Failure(ErrorKind::kClientError, "404", 404));
      },
      [&](const CallResult& result) { results.push_back(result); }, CancellationToken());

  scheduler.AdvanceBy(60000);
  EXPECT_EQ(attempts, 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].kind, ErrorKind::kClientError);
  EXPECT_EQ(results[0].http_status, 404);
}

// Test exhaustion after max_retries with doubling delays between attempts
TEST(RetryWithBackoffTest, ExhaustsAfterMaxRetries) {
  ManualScheduler scheduler;
  std::vector<int64_t> attempt_times;
  std::vector<int> observed_retries;
  std::vector<CallResult> results;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        attempt_times.push_back(scheduler.NowMs());
        done(CallResult::Failure(ErrorKind::kTransientNetwork, "503", 503));
      },
      [&](const CallResult& result) { results.push_back(result); }, CancellationToken(),
      [&](int retry, int64_t, const CallResult&) { observed_retries.push_back(retry); });

  scheduler.AdvanceBy(10000);
  EXPECT_EQ(attempt_times, (std::vector<int64_t>{0, 1000, 3000, 7000}));
  EXPECT_EQ(observed_retries, (std::vector<int>{1, 2, 3}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].kind, ErrorKind::kRetryExhausted);
  EXPECT_EQ(results[0].http_status, 503);
}

// Test cancellation suppresses later attempts and the completion
TEST(RetryWithBackoffTest, CancellationSuppressesEverything) {
  ManualScheduler scheduler;
  CancellationToken token;
  int attempts = 0;
  int completions = 0;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        ++attempts;
        done(CallResult::Failure(ErrorKind::kTransientNetwork, "timeout"));
      },
      [&](const CallResult&) { ++completions; }, token);

  token.Cancel();
  scheduler.AdvanceBy(10000);
  EXPECT_EQ(attempts, 1);
  EXPECT_EQ(completions, 0);
}

// Test cancelling the token removes the queued retry timer
TEST(RetryWithBackoffTest, CancellationRemovesPendingTimer) {
  ManualScheduler scheduler;
  CancellationToken token;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        done(CallResult::Failure(ErrorKind::kTransientNetwork, "timeout"));
      },
      [&](const CallResult&) {}, token);
  EXPECT_EQ(scheduler.PendingTimers(), 1u);

  token.Cancel();
  EXPECT_EQ(scheduler.PendingTimers(), 0u);
}

// Test a finished run leaves no hook behind on a long-lived token
TEST(RetryWithBackoffTest, FinishedRunIgnoresLaterCancel) {
  ManualScheduler scheduler;
  CancellationToken token;
  int completions = 0;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) { done(CallResult::Ok()); },
      [&](const CallResult&) { ++completions; }, token);
  EXPECT_EQ(completions, 1);

  token.Cancel();
  EXPECT_TRUE(token.IsCancelled());
  EXPECT_EQ(scheduler.PendingTimers(), 0u);
  EXPECT_EQ(completions, 1);
}

// Test a completion invoked twice is only honoured once
TEST(RetryWithBackoffTest, DuplicateCompletionIsIgnored) {
  ManualScheduler scheduler;
  int completions = 0;

  RetryWithBackoff(
      scheduler, MakePolicy(3, 1000), "op",
      [&](Completion done) {
        done(CallResult::Ok());
        done(CallResult::Failure(ErrorKind::kTransientNetwork, "late"));
      },
      [&](const CallResult&) { ++completions; }, CancellationToken());

  scheduler.AdvanceBy(10000);
  EXPECT_EQ(completions, 1);
}

// Test the reconnect budget spends max_retries attempts with doubling delays
TEST(ReconnectBudgetTest, SpendsBudgetThenRefuses) {
  whip::ReconnectBudget budget;
  RetryPolicy policy = MakePolicy(3, 1000);
  policy.cool_down_ms = 10000;

  auto first = budget.Evaluate(0, policy);
  auto second = budget.Evaluate(1000, policy);
  auto third = budget.Evaluate(3000, policy);
  auto fourth = budget.Evaluate(7000, policy);

  EXPECT_TRUE(first.retry);
  EXPECT_EQ(first.delay_ms, 1000);
  EXPECT_EQ(second.delay_ms, 2000);
  EXPECT_EQ(third.delay_ms, 4000);
  EXPECT_EQ(third.attempt, 3);
  EXPECT_FALSE(fourth.retry);
}

// Test the budget refills after a quiet period longer than the cool-down
TEST(ReconnectBudgetTest, CoolDownRefillsBudget) {
  whip::ReconnectBudget budget;
  RetryPolicy policy = MakePolicy(2, 500);
  policy.cool_down_ms = 10000;

  EXPECT_TRUE(budget.Evaluate(0, policy).retry);
  EXPECT_TRUE(budget.Evaluate(100, policy).retry);
  EXPECT_FALSE(budget.Evaluate(200, policy).retry);

  auto refreshed = budget.Evaluate(100 + 10001, policy);
  EXPECT_TRUE(refreshed.retry);
  EXPECT_EQ(refreshed.attempt, 1);
  EXPECT_EQ(refreshed.delay_ms, 500);
}

// Test Reset after a successful connection starts over
TEST(ReconnectBudgetTest, ResetStartsOver) {
  whip::ReconnectBudget budget;
  const RetryPolicy policy = MakePolicy(1, 1000);
  EXPECT_TRUE(budget.Evaluate(0, policy).retry);
  EXPECT_FALSE(budget.Evaluate(10, policy).retry);
  budget.Reset();
  EXPECT_EQ(budget.retry_count(), 0);
  EXPECT_FALSE(budget.last_attempt_ms().has_value());
  EXPECT_TRUE(budget.Evaluate(20, policy).retry);
}

}  // namespace
}  // namespace whipcast::runtime::testing
