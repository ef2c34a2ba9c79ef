// Repository: Whipcast
// Component: Connection State Machine
// Purpose: Pure transition table for publisher connection states.
// Copyright (c) 2025 Whipcast

#include "whipcast/whip/ConnectionState.hpp"

namespace whipcast::whip {

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kIdle: return "idle";
    case ConnectionState::kNegotiating: return "negotiating";
    case ConnectionState::kConnected: return "connected";
    case ConnectionState::kDegraded: return "degraded";
    case ConnectionState::kReconnecting: return "reconnecting";
    case ConnectionState::kFailed: return "failed";
    case ConnectionState::kClosed: return "closed";
  }
  return "unknown";
}

const char* ConnectionEventName(ConnectionEvent event) {
  switch (event) {
    case ConnectionEvent::kNegotiate: return "negotiate";
    case ConnectionEvent::kPeerConnected: return "peer_connected";
    case ConnectionEvent::kPeerDisconnected: return "peer_disconnected";
    case ConnectionEvent::kPeerFailed: return "peer_failed";
    case ConnectionEvent::kReconnectScheduled: return "reconnect_scheduled";
    case ConnectionEvent::kRetryExhausted: return "retry_exhausted";
    case ConnectionEvent::kClose: return "close";
  }
  return "unknown";
}

std::optional<ConnectionState> NextConnectionState(ConnectionState state, ConnectionEvent event) {
  using S = ConnectionState;
  using E = ConnectionEvent;

  if (event == E::kClose) return S::kClosed;

  switch (state) {
    case S::kIdle:
      if (event == E::kNegotiate) return S::kNegotiating;
      if (event == E::kRetryExhausted) return S::kFailed;
      return std::nullopt;

    case S::kNegotiating:
    case S::kDegraded:
    case S::kReconnecting:
      switch (event) {
        case E::kNegotiate:
          if (state == S::kReconnecting) return S::kNegotiating;
          return std::nullopt;
        case E::kPeerConnected: return S::kConnected;
        case E::kPeerDisconnected:
        case E::kPeerFailed: return S::kDegraded;
        case E::kReconnectScheduled: return S::kReconnecting;
        case E::kRetryExhausted: return S::kFailed;
        case E::kClose: return S::kClosed;
      }
      return std::nullopt;

    case S::kConnected:
      switch (event) {
        case E::kPeerConnected: return S::kConnected;
        case E::kPeerDisconnected:
        case E::kPeerFailed: return S::kDegraded;
        default: return std::nullopt;
      }

    case S::kFailed:
      if (event == E::kRetryExhausted) return S::kFailed;
      return std::nullopt;

    case S::kClosed:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace whipcast::whip
