// === Delivery Zone ===========================================================
//
// Describes one serviceable (or deactivated) delivery area as loaded from the
// backend, plus ingestion-time validation. Zones are immutable once handed to
// the geometry engine; malformed zones must be caught here rather than at
// query time.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/**
 * @brief A typed delivery area.
 *
 * Exactly one payload is meaningful, selected by `zone_type`: polygon zones use
 * `boundary_coordinates`, circle zones use `center` and `radius_km`. The
 * geometry engine treats an inconsistent zone as non-containing and infinitely
 * far away.
 */
struct DeliveryZone final {
    std::string identifier{};                       /**< Opaque backend identifier. */
    std::string name{};                             /**< Display name. */
    int zone_number{};                              /**< Ordinal of the zone inside its town. */
    int priority{1};                                /**< Higher priority zones are checked first. */
    bool is_active{true};                           /**< Inactive zones never contain anything. */
    ZoneType zone_type{ZoneType::Polygon};          /**< Payload selector. */
    std::vector<Coordinate> boundary_coordinates{}; /**< Polygon ring, ideally closed. */
    std::optional<Coordinate> center{};             /**< Circle centre. */
    std::optional<double> radius_km{};              /**< Circle radius in kilometres. */

    [[nodiscard]] bool is_polygon() const noexcept { return zone_type == ZoneType::Polygon; }
    [[nodiscard]] bool is_circle() const noexcept { return zone_type == ZoneType::Circle; }
};

using DeliveryZoneList = std::vector<DeliveryZone>;

/** @brief Build a polygon zone; throws std::invalid_argument on a bad payload. */
DeliveryZone make_polygon_zone(std::string identifier, std::string name, std::vector<Coordinate> boundary, bool is_active = true);

/** @brief Build a circle zone; throws std::invalid_argument on a bad payload. */
DeliveryZone make_circle_zone(std::string identifier, std::string name, Coordinate center, double radius_km, bool is_active = true);

/** @brief Hard problems that make @p zone unusable. Empty when the zone is sound. */
[[nodiscard]] std::vector<std::string> zone_issues(const DeliveryZone& zone);

/** @brief Outcome of validating a full zone catalog at ingestion time. */
struct ZoneValidationReport final {
    std::size_t zone_count{};
    std::size_t active_zone_count{};
    std::vector<std::string> issues{};   /**< Errors; the catalog should be rejected. */
    std::vector<std::string> warnings{}; /**< Tolerated irregularities. */

    [[nodiscard]] bool is_valid() const noexcept { return issues.empty(); }
};

/** @brief Validate every zone plus cross-zone constraints such as unique ids. */
[[nodiscard]] ZoneValidationReport validate_zone_catalog(const DeliveryZoneList& zones);

}  // namespace delivery_geofence
