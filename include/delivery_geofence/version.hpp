// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs.

#pragma once

#include <string_view>

namespace delivery_geofence {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace delivery_geofence
