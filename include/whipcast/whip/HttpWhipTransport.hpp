// Repository: Whipcast
// Component: HTTP WHIP Transport
// Purpose: IWhipTransport over cpp-httplib, run on the I/O worker.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_WHIP_HTTP_WHIP_TRANSPORT_HPP_
#define WHIPCAST_WHIP_HTTP_WHIP_TRANSPORT_HPP_

#include <functional>
#include <optional>
#include <string>

#include "whipcast/runtime/IScheduler.hpp"
#include "whipcast/runtime/IoWorker.hpp"
#include "whipcast/whip/IWhipTransport.hpp"

namespace whipcast::whip {

struct HttpWhipTransportConfig {
  // Response header carrying the low-latency playback URL.
  std::string playback_url_header = "livepeer-playback-url";
  // Sent as "Authorization: Bearer <token>" when non-empty.
  std::string bearer_token;
  int connect_timeout_s = 5;
  int read_timeout_s = 10;
};

// Maps one HTTP response onto a WhipAnswer. A 2xx without a body is a
// transient failure: there is no answer to apply.
WhipAnswer InterpretWhipResponse(int status,
                                 const std::string& body,
                                 const std::optional<std::string>& playback_header);

class HttpWhipTransport : public IWhipTransport {
 public:
  HttpWhipTransport(runtime::IoWorker& worker,
                    runtime::IScheduler& scheduler,
                    HttpWhipTransportConfig config);

  void PostOffer(const std::string& whip_url,
                 const std::string& offer_sdp,
                 std::function<void(WhipAnswer)> done) override;

 private:
  WhipAnswer Exchange(const std::string& whip_url, const std::string& offer_sdp) const;

  runtime::IoWorker& worker_;
  runtime::IScheduler& scheduler_;
  HttpWhipTransportConfig config_;
};

}  // namespace whipcast::whip

#endif  // WHIPCAST_WHIP_HTTP_WHIP_TRANSPORT_HPP_
