// Repository: Whipcast
// Component: Device Profile
// Purpose: Mobile detection by touch capability and user agent.
// Copyright (c) 2025 Whipcast

#include "whipcast/session/DeviceProfile.hpp"

#include <regex>

namespace whipcast::session {

bool IsMobileUserAgent(const std::string& user_agent) {
  static const std::regex kMobile(
      "Android|webOS|iPhone|iPad|iPod|BlackBerry|IEMobile|Opera Mini",
      std::regex::icase);
  return std::regex_search(user_agent, kMobile);
}

bool IsMobileProfile(const DeviceProfile& profile) {
  return profile.has_touch || IsMobileUserAgent(profile.user_agent);
}

bool PausesWhenHidden(const DeviceProfile& profile) {
  return IsMobileProfile(profile) && !profile.always_on;
}

}  // namespace whipcast::session
