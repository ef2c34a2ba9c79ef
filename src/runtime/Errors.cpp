// Repository: Whipcast
// Component: Error Taxonomy
// Purpose: Value-typed results for remote calls and device acquisition.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/Errors.hpp"

#include <sstream>

namespace whipcast::runtime {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "none";
    case ErrorKind::kClientError: return "client_error";
    case ErrorKind::kTransientNetwork: return "transient_network";
    case ErrorKind::kRetryExhausted: return "retry_exhausted";
    case ErrorKind::kConnectionDegraded: return "connection_degraded";
    case ErrorKind::kDeviceUnavailable: return "device_unavailable";
    case ErrorKind::kInvalidState: return "invalid_state";
  }
  return "unknown";
}

CallResult ClassifyHttpStatus(int status, const std::string& context) {
  if (status >= 200 && status < 300) {
    return CallResult::Ok();
  }
  std::ostringstream msg;
  msg << context << " failed with HTTP " << status;
  if (status >= 400 && status < 500) {
    return CallResult::Failure(ErrorKind::kClientError, msg.str(), status);
  }
  return CallResult::Failure(ErrorKind::kTransientNetwork, msg.str(), status);
}

std::string Describe(const CallResult& result) {
  if (result.success) return "ok";
  std::ostringstream out;
  out << ErrorKindName(result.kind) << ": " << result.message;
  if (result.http_status != 0) {
    out << " (http " << result.http_status << ")";
  }
  return out.str();
}

}  // namespace whipcast::runtime
