// Repository: Whipcast
// Component: HTTP WHIP Transport
// Purpose: POST application/sdp offers and classify the reply.
// Copyright (c) 2025 Whipcast

#include "whipcast/whip/HttpWhipTransport.hpp"

#include <exception>
#include <utility>

#include <httplib.h>

#include "whipcast/runtime/HttpUrl.hpp"
#include "whipcast/util/Logger.hpp"

namespace whipcast::whip {

using runtime::CallResult;
using runtime::ErrorKind;

WhipAnswer InterpretWhipResponse(int status,
                                 const std::string& body,
                                 const std::optional<std::string>& playback_header) {
  WhipAnswer answer;
  answer.result = runtime::ClassifyHttpStatus(status, "WHIP offer");
  if (!answer.result.success) return answer;

  if (body.empty()) {
    answer.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                        "WHIP offer: empty answer", status);
    return answer;
  }
  answer.answer_sdp = body;
  if (playback_header && !playback_header->empty()) {
    answer.playback_url = playback_header;
  }
  return answer;
}

HttpWhipTransport::HttpWhipTransport(runtime::IoWorker& worker,
                                     runtime::IScheduler& scheduler,
                                     HttpWhipTransportConfig config)
    : worker_(worker), scheduler_(scheduler), config_(std::move(config)) {}

void HttpWhipTransport::PostOffer(const std::string& whip_url,
                                  const std::string& offer_sdp,
                                  std::function<void(WhipAnswer)> done) {
  worker_.SubmitThen<WhipAnswer>(
      scheduler_,
      [this, whip_url, offer_sdp]() { return Exchange(whip_url, offer_sdp); },
      std::move(done));
}

WhipAnswer HttpWhipTransport::Exchange(const std::string& whip_url,
                                       const std::string& offer_sdp) const {
  WhipAnswer answer;
  const auto url = runtime::SplitHttpUrl(whip_url);
  if (!url) {
    answer.result = CallResult::Failure(ErrorKind::kClientError, "invalid WHIP URL: " + whip_url);
    return answer;
  }

  try {
    httplib::Client client(url->origin);
    client.set_connection_timeout(config_.connect_timeout_s, 0);
    client.set_read_timeout(config_.read_timeout_s, 0);
    client.set_follow_location(true);

    httplib::Headers headers;
    if (!config_.bearer_token.empty()) {
      headers.emplace("Authorization", "Bearer " + config_.bearer_token);
    }

    util::Logger::Debug("[HttpWhipTransport] POST " + whip_url + " (" +
                        std::to_string(offer_sdp.size()) + " bytes)");
    auto res = client.Post(url->target, headers, offer_sdp, "application/sdp");
    if (!res) {
      answer.result = CallResult::Failure(
          ErrorKind::kTransientNetwork,
          "WHIP offer: " + httplib::to_string(res.error()));
      return answer;
    }

    std::optional<std::string> playback;
    if (!config_.playback_url_header.empty() && res->has_header(config_.playback_url_header)) {
      playback = res->get_header_value(config_.playback_url_header);
    }
    return InterpretWhipResponse(res->status, res->body, playback);
  } catch (const std::exception& e) {
    answer.result = CallResult::Failure(ErrorKind::kTransientNetwork,
                                        std::string("WHIP offer: ") + e.what());
    return answer;
  }
}

}  // namespace whipcast::whip
