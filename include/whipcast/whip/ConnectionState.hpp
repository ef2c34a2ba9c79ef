// Repository: Whipcast
// Component: Connection State Machine
// Purpose: Publisher connection states and the pure transition table that
//          gates every change.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_CONNECTION_STATE_HPP_
#define WHIPCAST_WHIP_CONNECTION_STATE_HPP_

#include <optional>

namespace whipcast::whip {

enum class ConnectionState {
  kIdle,
  kNegotiating,
  kConnected,
  kDegraded,
  kReconnecting,
  kFailed,   // terminal until the caller connects again
  kClosed,
};

enum class ConnectionEvent {
  kNegotiate,
  kPeerConnected,
  kPeerDisconnected,
  kPeerFailed,
  kReconnectScheduled,
  kRetryExhausted,
  kClose,
};

const char* ConnectionStateName(ConnectionState state);
const char* ConnectionEventName(ConnectionEvent event);

// Returns the next state, or nullopt if event is not legal in state.
//
//                 negotiate  connected  disconnected  failed    reconnect  exhausted  close
//   Idle          Negotiat.  -          -             -         -          Failed     Closed
//   Negotiating   -          Connected  Degraded      Degraded  Reconn.    Failed     Closed
//   Connected     -          Connected  Degraded      Degraded  -          -          Closed
//   Degraded      -          Connected  Degraded      Degraded  Reconn.    Failed     Closed
//   Reconnecting  Negotiat.  Connected  Degraded      Degraded  Reconn.    Failed     Closed
//   Failed        -          -          -             -         -          Failed     Closed
//   Closed        -          -          -             -         -          -          Closed
std::optional<ConnectionState> NextConnectionState(ConnectionState state, ConnectionEvent event);

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_CONNECTION_STATE_HPP_
