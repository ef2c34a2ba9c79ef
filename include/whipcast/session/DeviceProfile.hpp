// Repository: Whipcast
// Component: Device Profile
// Purpose: Decides whether the host behaves like a mobile device whose
//          session should pause while the app is hidden.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_SESSION_DEVICE_PROFILE_HPP_
#define WHIPCAST_SESSION_DEVICE_PROFILE_HPP_

#include <string>

namespace whipcast::session {

struct DeviceProfile {
  bool has_touch = false;
  std::string user_agent;
  // Keeps publishing while hidden, even on mobile.
  bool always_on = false;
};

// Android, webOS, iPhone, iPad, iPod, BlackBerry, IEMobile, Opera Mini.
bool IsMobileUserAgent(const std::string& user_agent);

bool IsMobileProfile(const DeviceProfile& profile);

// True when hiding the app should stop the session.
bool PausesWhenHidden(const DeviceProfile& profile);

}  // namespace whipcast::session

#endif  // WHIPCAST_SESSION_DEVICE_PROFILE_HPP_
