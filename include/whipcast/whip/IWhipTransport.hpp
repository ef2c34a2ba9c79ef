// Repository: Whipcast
// Component: WHIP Transport Interface
// Purpose: The single HTTP exchange of non-trickle WHIP: offer in, answer out.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_IWHIP_TRANSPORT_HPP_
#define WHIPCAST_WHIP_IWHIP_TRANSPORT_HPP_

#include <functional>
#include <optional>
#include <string>

#include "whipcast/runtime/Errors.hpp"

namespace whipcast::whip {

struct WhipAnswer {
  runtime::CallResult result;
  std::string answer_sdp;
  // Low-latency playback URL advertised in a response header, if any.
  std::optional<std::string> playback_url;
};

class IWhipTransport {
 public:
  virtual ~IWhipTransport() = default;

  // POST offer_sdp to whip_url (Content-Type: application/sdp). done runs on
  // the event loop exactly once. Status mapping: 2xx success, 4xx
  // kClientError, everything else (including transport errors)
  // kTransientNetwork.
  virtual void PostOffer(const std::string& whip_url,
                         const std::string& offer_sdp,
                         std::function<void(WhipAnswer)> done) = 0;
};

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_IWHIP_TRANSPORT_HPP_
