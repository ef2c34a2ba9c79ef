// Repository: Whipcast
// Component: HTTP URL Split
// Purpose: Splits an absolute URL into the origin an HTTP client connects to
//          and the request target it sends.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_HTTP_URL_HPP_
#define WHIPCAST_RUNTIME_HTTP_URL_HPP_

#include <optional>
#include <string>

namespace whipcast::runtime {

struct HttpUrl {
  std::string origin;  // scheme://host[:port]
  std::string target;  // /path[?query], never empty
};

// Returns nullopt unless url starts with http:// or https:// and names a host.
inline std::optional<HttpUrl> SplitHttpUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return std::nullopt;
  const std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") return std::nullopt;

  const auto host_begin = scheme_end + 3;
  const auto path_begin = url.find_first_of("/?", host_begin);
  HttpUrl out;
  if (path_begin == std::string::npos) {
    out.origin = url;
    out.target = "/";
  } else {
    out.origin = url.substr(0, path_begin);
    out.target = url.substr(path_begin);
    if (out.target[0] == '?') out.target.insert(0, "/");
  }
  if (out.origin.size() <= host_begin) return std::nullopt;
  return out;
}

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_HTTP_URL_HPP_
