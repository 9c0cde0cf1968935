// === Coordinate Parsing ======================================================
//
// Converts boundary data exported from mapping tools into coordinates the
// geometry engine understands.

#pragma once

#include <string_view>
#include <vector>

#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/**
 * @brief Parse a KML `<coordinates>` payload.
 *
 * Tuples are whitespace separated and written `lng,lat[,alt]`; the altitude is
 * ignored. Tuples with fewer than two components are skipped.
 *
 * @throws std::invalid_argument when a component is not a number.
 */
[[nodiscard]] std::vector<Coordinate> parse_kml_coordinates(std::string_view kml_coordinates);

}  // namespace delivery_geofence
