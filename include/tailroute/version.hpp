// === Version Metadata ========================================================
//
// Exposes the provider's semantic version string used in logs and the health
// endpoint.

#pragma once

#include <string_view>

namespace tailroute {

inline constexpr std::string_view k_version{"0.3.0"};

inline constexpr std::string_view k_service_name{"tailroute"};

}  // namespace tailroute
