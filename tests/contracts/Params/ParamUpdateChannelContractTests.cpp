// Repository: Whipcast
// Component: Parameter Update Channel Contract Tests
// Purpose: Verify last-write-wins coalescing, single-flight delivery, gating
//          and retry of remote parameter updates.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fixtures/FakeSessionApi.hpp"
#include "support/ManualScheduler.hpp"
#include "whipcast/params/ParamUpdateChannel.hpp"

namespace whipcast::params::testing {
namespace {

using runtime::CallResult;
using runtime::ErrorKind;
using tests::fixtures::FakeSessionApi;

DiffusionParams Prompt(const std::string& prompt) {
  DiffusionParams params;
  params.prompt = prompt;
  return params;
}

class ParamUpdateChannelTest : public ::testing::Test {
 protected:
  ParamUpdateChannelTest() : api_(scheduler_), channel_(scheduler_, api_, Policy()) {
    channel_.OnResult([this](const CallResult& r) { results_.push_back(r); });
  }

  static runtime::RetryPolicy Policy() {
    runtime::RetryPolicy policy;
    policy.max_retries = 2;
    policy.base_delay_ms = 500;
    return policy;
  }

  void OpenAndBind() {
    channel_.BindSession("str_1");
    channel_.OpenGate();
    scheduler_.RunUntilIdle();
  }

  std::vector<std::string> SentPrompts() const {
    std::vector<std::string> out;
    for (const auto& update : api_.updates) out.push_back(update.second.prompt);
    return out;
  }

  ManualScheduler scheduler_;
  FakeSessionApi api_;
  ParamUpdateChannel channel_;
  std::vector<CallResult> results_;
};

// Test nothing is sent while the gate is closed
TEST_F(ParamUpdateChannelTest, ClosedGateHoldsUpdates) {
  channel_.BindSession("str_1");
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  EXPECT_TRUE(api_.updates.empty());
  EXPECT_TRUE(channel_.has_pending());

  channel_.OpenGate();
  scheduler_.RunUntilIdle();
  ASSERT_EQ(api_.updates.size(), 1u);
  EXPECT_EQ(api_.updates[0].first, "str_1");
  EXPECT_EQ(api_.updates[0].second.prompt, "a");
}

// Test submissions before the gate opens collapse to the newest one
TEST_F(ParamUpdateChannelTest, SubmissionsBeforeGateCoalesce) {
  channel_.BindSession("str_1");
  channel_.Submit(Prompt("a"));
  channel_.Submit(Prompt("b"));
  channel_.Submit(Prompt("c"));
  channel_.OpenGate();
  scheduler_.RunUntilIdle();
  EXPECT_EQ(SentPrompts(), (std::vector<std::string>{"c"}));
}

// Test an unbound channel waits for a session
TEST_F(ParamUpdateChannelTest, WaitsForSessionBinding) {
  channel_.OpenGate();
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  EXPECT_TRUE(api_.updates.empty());

  channel_.BindSession("str_9");
  scheduler_.RunUntilIdle();
  ASSERT_EQ(api_.updates.size(), 1u);
  EXPECT_EQ(api_.updates[0].first, "str_9");
}

// Test at most one call is in flight and the newest input goes next
TEST_F(ParamUpdateChannelTest, SingleFlightLastWriteWins) {
  api_.hold_updates = true;
  OpenAndBind();

  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  EXPECT_TRUE(channel_.in_flight());
  EXPECT_EQ(api_.held_updates(), 1u);

  channel_.Submit(Prompt("b"));
  channel_.Submit(Prompt("c"));
  channel_.Submit(Prompt("d"));
  scheduler_.RunUntilIdle();
  EXPECT_EQ(api_.updates.size(), 1u);

  api_.CompleteUpdate();
  scheduler_.RunUntilIdle();
  EXPECT_EQ(SentPrompts(), (std::vector<std::string>{"a", "d"}));

  api_.CompleteUpdate();
  scheduler_.RunUntilIdle();
  EXPECT_FALSE(channel_.in_flight());
  EXPECT_FALSE(channel_.has_pending());
  EXPECT_EQ(channel_.calls_issued(), 2);
  EXPECT_EQ(results_.size(), 2u);
}

// Test a transient failure is retried with backoff as one call
TEST_F(ParamUpdateChannelTest, TransientFailureIsRetried) {
  api_.scripted_updates.push_back(
      CallResult::Failure(ErrorKind::kTransientNetwork, "unavailable", 503));
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  EXPECT_EQ(api_.updates.size(), 1u);
  EXPECT_TRUE(channel_.in_flight());

  scheduler_.AdvanceBy(499);
  EXPECT_EQ(api_.updates.size(), 1u);
  scheduler_.AdvanceBy(1);
  EXPECT_EQ(api_.updates.size(), 2u);
  ASSERT_EQ(results_.size(), 1u);
  EXPECT_TRUE(results_[0].success);
  EXPECT_EQ(channel_.calls_issued(), 1);
}

// Test input arriving during retries still waits for the call to finish
TEST_F(ParamUpdateChannelTest, RetryKeepsSingleFlight) {
  api_.scripted_updates.push_back(CallResult::Failure(ErrorKind::kTransientNetwork, "x", 500));
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  channel_.Submit(Prompt("b"));
  scheduler_.RunUntilIdle();
  EXPECT_EQ(api_.updates.size(), 1u);

  scheduler_.AdvanceBy(500);
  EXPECT_EQ(SentPrompts(), (std::vector<std::string>{"a", "a", "b"}));
}

// Test a client error is reported and not retried
TEST_F(ParamUpdateChannelTest, ClientErrorIsDropped) {
  api_.scripted_updates.push_back(CallResult::Failure(ErrorKind::kClientError, "bad", 422));
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.AdvanceBy(10000);

  EXPECT_EQ(api_.updates.size(), 1u);
  ASSERT_EQ(results_.size(), 1u);
  EXPECT_EQ(results_[0].kind, ErrorKind::kClientError);
  EXPECT_FALSE(channel_.in_flight());

  channel_.Submit(Prompt("b"));
  scheduler_.RunUntilIdle();
  EXPECT_EQ(api_.updates.size(), 2u);
}

// Test exhausting retries releases the slot
TEST_F(ParamUpdateChannelTest, ExhaustedRetriesReleaseSlot) {
  for (int i = 0; i < 3; ++i) {
    api_.scripted_updates.push_back(CallResult::Failure(ErrorKind::kTransientNetwork, "x", 502));
  }
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.AdvanceBy(1500);

  EXPECT_EQ(api_.updates.size(), 3u);
  ASSERT_EQ(results_.size(), 1u);
  EXPECT_EQ(results_[0].kind, ErrorKind::kRetryExhausted);
  EXPECT_FALSE(channel_.in_flight());
}

// Test reopening the gate re-sends the current value
TEST_F(ParamUpdateChannelTest, ReopeningGateResendsLatest) {
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  channel_.CloseGate();
  channel_.OpenGate();
  scheduler_.RunUntilIdle();
  EXPECT_EQ(SentPrompts(), (std::vector<std::string>{"a", "a"}));
}

// Test Reset ignores a late completion and drops pending input
TEST_F(ParamUpdateChannelTest, ResetIgnoresLateCompletion) {
  api_.hold_updates = true;
  OpenAndBind();
  channel_.Submit(Prompt("a"));
  scheduler_.RunUntilIdle();
  channel_.Submit(Prompt("b"));

  channel_.Reset();
  EXPECT_FALSE(channel_.gate_open());
  EXPECT_FALSE(channel_.in_flight());
  EXPECT_FALSE(channel_.has_pending());
  EXPECT_FALSE(channel_.latest().has_value());

  api_.CompleteUpdate();
  scheduler_.RunUntilIdle();
  EXPECT_TRUE(results_.empty());
  EXPECT_EQ(api_.updates.size(), 1u);
}

// Test a channel reused after Reset serves the new session
TEST_F(ParamUpdateChannelTest, ReusableAfterReset) {
  OpenAndBind();
  channel_.Submit(Prompt("old"));
  scheduler_.RunUntilIdle();
  channel_.Reset();

  channel_.BindSession("str_2");
  channel_.OpenGate();
  channel_.Submit(Prompt("new"));
  scheduler_.RunUntilIdle();
  ASSERT_EQ(api_.updates.size(), 2u);
  EXPECT_EQ(api_.updates[1].first, "str_2");
  EXPECT_EQ(api_.updates[1].second.prompt, "new");
}

}  // namespace
}  // namespace whipcast::params::testing
