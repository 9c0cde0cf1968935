// === Zone Geometry ===========================================================
//
// Stateless geometric predicates over coordinates and delivery zones:
// great-circle distance, containment, nearest-zone ranking, shape validation,
// and bounding-box pre-filtering. Inputs and outputs are in degrees;
// trigonometry runs in radians. No special handling of the antimeridian or the
// poles, which is acceptable for a regional delivery service.
//
// None of these functions throw. Malformed zones (wrong payload for their tag,
// too few vertices) are treated as non-containing and infinitely far away.

#pragma once

#include <optional>
#include <vector>

#include "delivery_geofence/delivery_zone.hpp"
#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

inline constexpr double k_earth_radius_km{6'371.0};

/** @brief How distance to a polygon zone is measured when ranking zones. */
enum class PolygonDistanceMode {
    Vertex,  /**< Minimum distance to any vertex; understates proximity near long edges. */
    Edge     /**< Minimum distance to any boundary segment. */
};

/** @brief Great-circle distance in kilometres (Haversine). */
[[nodiscard]] double haversine_distance_km(const Coordinate& from, const Coordinate& to) noexcept;

/**
 * @brief Containment test dispatched on the zone's shape.
 *
 * Circles are inclusive of their boundary. Polygons use the even-odd rule
 * with a ray cast towards increasing longitude. Inactive zones never contain.
 */
[[nodiscard]] bool contains_point(const Coordinate& point, const DeliveryZone& zone) noexcept;

/** @brief Distance used for nearest-zone ranking; infinity for inactive or malformed zones. */
[[nodiscard]] double distance_to_zone_km(const Coordinate& point,
                                         const DeliveryZone& zone,
                                         PolygonDistanceMode mode = PolygonDistanceMode::Vertex) noexcept;

/** @brief Closest active, well-formed zone to @p point, if any. */
[[nodiscard]] std::optional<DeliveryZone> find_closest_zone(const Coordinate& point,
                                                            const DeliveryZoneList& zones,
                                                            PolygonDistanceMode mode = PolygonDistanceMode::Vertex);

/** @brief At least three points and a ring closed to within 10 m. */
[[nodiscard]] bool validate_polygon(const std::vector<Coordinate>& points) noexcept;

/** @brief Latitude in [-90, 90] and longitude in [-180, 180]; NaN is out of range. */
[[nodiscard]] bool is_valid_coordinate(const Coordinate& coordinate) noexcept;

/** @brief Centre within latitude/longitude range and radius in (0.1, 50] km. */
[[nodiscard]] bool validate_circle(const Coordinate& center, double radius_km) noexcept;

/** @brief Axis-aligned bounds of @p points; all zeros for an empty list. */
[[nodiscard]] BoundingBox bounding_box(const std::vector<Coordinate>& points) noexcept;

/** @brief Inclusive box test, intended as a cheap pre-filter before polygon tests. */
[[nodiscard]] bool is_in_bounding_box(const Coordinate& point, const BoundingBox& box) noexcept;

/** @brief Vertex average; (0, 0) for an empty list. */
[[nodiscard]] Coordinate polygon_center(const std::vector<Coordinate>& points) noexcept;

/** @brief Approximate planar area in square kilometres. */
[[nodiscard]] double polygon_area_km2(const std::vector<Coordinate>& points) noexcept;

}  // namespace delivery_geofence
