// === Zone Detection ==========================================================
//
// Resolves which delivery zone, if any, serves a coordinate. Zones are scanned
// in descending priority and polygon zones are pre-filtered by their bounding
// box before the ray cast.

#pragma once

#include <optional>
#include <string>

#include "delivery_geofence/delivery_zone.hpp"

namespace delivery_geofence {

/** @brief Outcome of matching one coordinate against the zone catalog. */
struct ZoneDetectionResult final {
    bool is_in_zone{};                  /**< True when a serving zone was found. */
    std::optional<DeliveryZone> zone{}; /**< The serving zone. */
    Coordinate coordinates{};           /**< The probed coordinate. */
    std::string message{};              /**< User-facing summary. */
};

/** @brief Find the highest-priority active zone containing @p point. */
[[nodiscard]] ZoneDetectionResult detect_zone(const Coordinate& point, const DeliveryZoneList& zones);

}  // namespace delivery_geofence
