// Repository: Whipcast
// Component: Error Taxonomy
// Purpose: Value-typed results for remote calls and device acquisition.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_ERRORS_HPP_
#define WHIPCAST_RUNTIME_ERRORS_HPP_

#include <string>

namespace whipcast::runtime {

enum class ErrorKind {
  kNone,
  // 4xx from a remote endpoint. Never retried.
  kClientError,
  // Any other non-2xx, timeouts, transport failures. Retried.
  kTransientNetwork,
  // A retry policy ran out of attempts.
  kRetryExhausted,
  // Peer connection lost; handled internally by ICE restart / reconnect.
  kConnectionDegraded,
  // Camera or microphone could not be opened; a fallback was used.
  kDeviceUnavailable,
  // Operation not permitted in the current lifecycle state.
  kInvalidState,
};

const char* ErrorKindName(ErrorKind kind);

// Outcome of one remote call or device operation.
struct CallResult {
  bool success = true;
  ErrorKind kind = ErrorKind::kNone;
  int http_status = 0;  // 0 when no HTTP exchange happened
  std::string message;

  static CallResult Ok() { return CallResult{}; }
  static CallResult Failure(ErrorKind kind, std::string message, int http_status = 0) {
    CallResult r;
    r.success = false;
    r.kind = kind;
    r.http_status = http_status;
    r.message = std::move(message);
    return r;
  }
};

// Maps an HTTP status to a result: 2xx success, [400,500) client error,
// anything else transient.
CallResult ClassifyHttpStatus(int status, const std::string& context);

// Formats "kind: message (http N)" for logs.
std::string Describe(const CallResult& result);

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_ERRORS_HPP_
