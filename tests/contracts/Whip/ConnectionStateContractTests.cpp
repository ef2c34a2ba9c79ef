// Repository: Whipcast
// Component: Connection State Contract Tests
// Purpose: Verify the publisher's connection state table, and the WHIP HTTP
//          response and URL handling.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include "whipcast/runtime/HttpUrl.hpp"
#include "whipcast/whip/ConnectionState.hpp"
#include "whipcast/whip/HttpWhipTransport.hpp"

namespace whipcast::whip::testing {
namespace {

using S = ConnectionState;
using E = ConnectionEvent;

// Test the happy path through negotiation
TEST(ConnectionStateTest, NegotiateThenConnect) {
  EXPECT_EQ(NextConnectionState(S::kIdle, E::kNegotiate), S::kNegotiating);
  EXPECT_EQ(NextConnectionState(S::kNegotiating, E::kPeerConnected), S::kConnected);
}

// Test a connected peer degrades on disconnect or failure
TEST(ConnectionStateTest, ConnectedDegrades) {
  EXPECT_EQ(NextConnectionState(S::kConnected, E::kPeerDisconnected), S::kDegraded);
  EXPECT_EQ(NextConnectionState(S::kConnected, E::kPeerFailed), S::kDegraded);
  EXPECT_EQ(NextConnectionState(S::kDegraded, E::kPeerConnected), S::kConnected);
}

// Test the reconnect cycle
TEST(ConnectionStateTest, ReconnectCycle) {
  EXPECT_EQ(NextConnectionState(S::kDegraded, E::kReconnectScheduled), S::kReconnecting);
  EXPECT_EQ(NextConnectionState(S::kReconnecting, E::kNegotiate), S::kNegotiating);
  EXPECT_EQ(NextConnectionState(S::kDegraded, E::kRetryExhausted), S::kFailed);
  EXPECT_EQ(NextConnectionState(S::kReconnecting, E::kRetryExhausted), S::kFailed);
}

// Test illegal events are rejected
TEST(ConnectionStateTest, RejectsIllegalEvents) {
  EXPECT_FALSE(NextConnectionState(S::kIdle, E::kPeerConnected).has_value());
  EXPECT_FALSE(NextConnectionState(S::kConnected, E::kNegotiate).has_value());
  EXPECT_FALSE(NextConnectionState(S::kConnected, E::kReconnectScheduled).has_value());
  EXPECT_FALSE(NextConnectionState(S::kDegraded, E::kNegotiate).has_value());
  EXPECT_FALSE(NextConnectionState(S::kFailed, E::kPeerConnected).has_value());
  EXPECT_FALSE(NextConnectionState(S::kFailed, E::kNegotiate).has_value());
}

// Test Close is legal everywhere and Closed is terminal
TEST(ConnectionStateTest, CloseIsAlwaysLegalAndTerminal) {
  for (S state : {S::kIdle, S::kNegotiating, S::kConnected, S::kDegraded, S::kReconnecting,
                  S::kFailed, S::kClosed}) {
    EXPECT_EQ(NextConnectionState(state, E::kClose), S::kClosed) << ConnectionStateName(state);
  }
  for (E event : {E::kNegotiate, E::kPeerConnected, E::kPeerDisconnected, E::kPeerFailed,
                  E::kReconnectScheduled, E::kRetryExhausted}) {
    EXPECT_FALSE(NextConnectionState(S::kClosed, event).has_value())
        << ConnectionEventName(event);
  }
}

// Test a 201 with an SDP body becomes the answer and picks up the header
TEST(WhipResponseTest, SuccessCarriesAnswerAndPlaybackUrl) {
  const WhipAnswer answer =
      InterpretWhipResponse(201, "v=0\r\n", std::string("https://play.example/x"));
  EXPECT_TRUE(answer.result.success);
  EXPECT_EQ(answer.answer_sdp, "v=0\r\n");
  ASSERT_TRUE(answer.playback_url.has_value());
  EXPECT_EQ(*answer.playback_url, "https://play.example/x");
}

// Test an empty header value is treated as absent
TEST(WhipResponseTest, EmptyPlaybackHeaderIsIgnored) {
  const WhipAnswer answer = InterpretWhipResponse(201, "v=0\r\n", std::string());
  EXPECT_TRUE(answer.result.success);
  EXPECT_FALSE(answer.playback_url.has_value());
}

// Test 4xx is a client error and 5xx is transient
TEST(WhipResponseTest, ClassifiesFailures) {
  const WhipAnswer forbidden = InterpretWhipResponse(403, "nope", std::nullopt);
  EXPECT_EQ(forbidden.result.kind, runtime::ErrorKind::kClientError);
  EXPECT_EQ(forbidden.result.http_status, 403);

  const WhipAnswer unavailable = InterpretWhipResponse(503, "", std::nullopt);
  EXPECT_EQ(unavailable.result.kind, runtime::ErrorKind::kTransientNetwork);
}

// Test a success without a body cannot be applied and is retried
TEST(WhipResponseTest, EmptyAnswerIsTransient) {
  const WhipAnswer answer = InterpretWhipResponse(201, "", std::nullopt);
  EXPECT_FALSE(answer.result.success);
  EXPECT_EQ(answer.result.kind, runtime::ErrorKind::kTransientNetwork);
}

// Test URLs are split into origin and request target
TEST(HttpUrlTest, SplitsOriginAndTarget) {
  auto url = runtime::SplitHttpUrl("https://ai.livepeer.com/live/video-to-video/abc/whip");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->origin, "https://ai.livepeer.com");
  EXPECT_EQ(url->target, "/live/video-to-video/abc/whip");

  auto bare = runtime::SplitHttpUrl("http://localhost:8889");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->origin, "http://localhost:8889");
  EXPECT_EQ(bare->target, "/");

  auto query = runtime::SplitHttpUrl("http://host?token=1");
  ASSERT_TRUE(query.has_value());
  EXPECT_EQ(query->target, "/?token=1");
}

// Test non-HTTP schemes and missing hosts are rejected
TEST(HttpUrlTest, RejectsUnsupportedUrls) {
  EXPECT_FALSE(runtime::SplitHttpUrl("ftp://host/x").has_value());
  EXPECT_FALSE(runtime::SplitHttpUrl("host/x").has_value());
  EXPECT_FALSE(runtime::SplitHttpUrl("https:///path").has_value());
}

}  // namespace
}  // namespace whipcast::whip::testing
