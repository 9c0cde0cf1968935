#include "delivery_geofence/zone_geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace delivery_geofence {

namespace {

constexpr double k_closed_ring_tolerance_km{0.01};  /**< First/last vertex gap tolerated as "closed" (about 10 m). */
constexpr double k_min_circle_radius_km{0.1};       /**< Exclusive lower bound for circle radii. */
constexpr double k_max_circle_radius_km{50.0};      /**< Inclusive upper bound for circle radii. */
constexpr double k_km_per_degree{111.32};           /**< Rough kilometres per degree for planar approximations. */
constexpr double k_infinite_distance{std::numeric_limits<double>::infinity()};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

bool is_point_in_polygon(const Coordinate& point, const std::vector<Coordinate>& polygon) noexcept {
    if (polygon.size() < 3) {
        return false;
    }

    std::size_t crossings = 0;
    for (std::size_t index = 0; index < polygon.size(); ++index) {
        const Coordinate& vertex_a = polygon[index];
        const Coordinate& vertex_b = polygon[(index + 1) % polygon.size()];

        const bool straddles = (vertex_a.latitude_deg > point.latitude_deg) != (vertex_b.latitude_deg > point.latitude_deg);
        if (!straddles) {
            continue;
        }
        const double crossing_longitude = (vertex_b.longitude_deg - vertex_a.longitude_deg)
                * (point.latitude_deg - vertex_a.latitude_deg)
                / (vertex_b.latitude_deg - vertex_a.latitude_deg)
            + vertex_a.longitude_deg;
        if (point.longitude_deg < crossing_longitude) {
            ++crossings;
        }
    }
    return crossings % 2 == 1;
}

double distance_to_nearest_vertex_km(const Coordinate& point, const std::vector<Coordinate>& polygon) noexcept {
    double min_distance = k_infinite_distance;
    for (const Coordinate& vertex : polygon) {
        min_distance = std::min(min_distance, haversine_distance_km(point, vertex));
    }
    return min_distance;
}

// Projects each segment onto a local equirectangular plane centred on the
// probe, clamps the foot of the perpendicular to the segment, then measures
// the great-circle distance to that foot.
double distance_to_nearest_edge_km(const Coordinate& point, const std::vector<Coordinate>& polygon) noexcept {
    const double longitude_scale = std::cos(degrees_to_radians(point.latitude_deg));
    double min_distance = k_infinite_distance;
    for (std::size_t index = 0; index < polygon.size(); ++index) {
        const Coordinate& vertex_a = polygon[index];
        const Coordinate& vertex_b = polygon[(index + 1) % polygon.size()];

        const double ax = (vertex_a.longitude_deg - point.longitude_deg) * longitude_scale;
        const double ay = vertex_a.latitude_deg - point.latitude_deg;
        const double bx = (vertex_b.longitude_deg - point.longitude_deg) * longitude_scale;
        const double by = vertex_b.latitude_deg - point.latitude_deg;

        const double dx = bx - ax;
        const double dy = by - ay;
        const double length_squared = dx * dx + dy * dy;
        double t = 0.0;
        if (length_squared > 0.0) {
            t = std::clamp(-(ax * dx + ay * dy) / length_squared, 0.0, 1.0);
        }

        const Coordinate foot{
            vertex_a.latitude_deg + t * (vertex_b.latitude_deg - vertex_a.latitude_deg),
            vertex_a.longitude_deg + t * (vertex_b.longitude_deg - vertex_a.longitude_deg)
        };
        min_distance = std::min(min_distance, haversine_distance_km(point, foot));
    }
    return min_distance;
}

}  // namespace

double haversine_distance_km(const Coordinate& from, const Coordinate& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = degrees_to_radians(to.latitude_deg - from.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_km * c;
}

bool contains_point(const Coordinate& point, const DeliveryZone& zone) noexcept {
    if (!zone.is_active) {
        return false;
    }

    switch (zone.zone_type) {
        case ZoneType::Polygon:
            return is_point_in_polygon(point, zone.boundary_coordinates);
        case ZoneType::Circle:
            if (!zone.center.has_value() || !zone.radius_km.has_value()) {
                return false;
            }
            return haversine_distance_km(point, zone.center.value()) <= zone.radius_km.value();
    }
    return false;
}

double distance_to_zone_km(const Coordinate& point, const DeliveryZone& zone, PolygonDistanceMode mode) noexcept {
    if (!zone.is_active) {
        return k_infinite_distance;
    }

    switch (zone.zone_type) {
        case ZoneType::Circle:
            if (!zone.center.has_value() || !zone.radius_km.has_value()) {
                return k_infinite_distance;
            }
            return haversine_distance_km(point, zone.center.value());
        case ZoneType::Polygon:
            if (zone.boundary_coordinates.size() < 3) {
                return k_infinite_distance;
            }
            if (mode == PolygonDistanceMode::Edge) {
                return distance_to_nearest_edge_km(point, zone.boundary_coordinates);
            }
            return distance_to_nearest_vertex_km(point, zone.boundary_coordinates);
    }
    return k_infinite_distance;
}

std::optional<DeliveryZone> find_closest_zone(const Coordinate& point, const DeliveryZoneList& zones, PolygonDistanceMode mode) {
    const DeliveryZone* closest_zone = nullptr;
    double min_distance = k_infinite_distance;

    for (const DeliveryZone& zone : zones) {
        const double distance = distance_to_zone_km(point, zone, mode);
        if (distance < min_distance) {
            min_distance = distance;
            closest_zone = &zone;
        }
    }

    if (closest_zone == nullptr) {
        return std::nullopt;
    }
    return *closest_zone;
}

bool validate_polygon(const std::vector<Coordinate>& points) noexcept {
    if (points.size() < 3) {
        return false;
    }
    return haversine_distance_km(points.front(), points.back()) < k_closed_ring_tolerance_km;
}

bool is_valid_coordinate(const Coordinate& coordinate) noexcept {
    // Written as inclusions so NaN fails every test.
    return coordinate.latitude_deg >= -90.0 && coordinate.latitude_deg <= 90.0
        && coordinate.longitude_deg >= -180.0 && coordinate.longitude_deg <= 180.0;
}

bool validate_circle(const Coordinate& center, double radius_km) noexcept {
    if (!is_valid_coordinate(center)) {
        return false;
    }
    return radius_km > k_min_circle_radius_km && radius_km <= k_max_circle_radius_km;
}

BoundingBox bounding_box(const std::vector<Coordinate>& points) noexcept {
    if (points.empty()) {
        return BoundingBox{};
    }

    BoundingBox box{
        points.front().latitude_deg,
        points.front().latitude_deg,
        points.front().longitude_deg,
        points.front().longitude_deg
    };
    for (const Coordinate& point : points) {
        box.min_latitude_deg = std::min(box.min_latitude_deg, point.latitude_deg);
        box.max_latitude_deg = std::max(box.max_latitude_deg, point.latitude_deg);
        box.min_longitude_deg = std::min(box.min_longitude_deg, point.longitude_deg);
        box.max_longitude_deg = std::max(box.max_longitude_deg, point.longitude_deg);
    }
    return box;
}

bool is_in_bounding_box(const Coordinate& point, const BoundingBox& box) noexcept {
    return point.latitude_deg >= box.min_latitude_deg
        && point.latitude_deg <= box.max_latitude_deg
        && point.longitude_deg >= box.min_longitude_deg
        && point.longitude_deg <= box.max_longitude_deg;
}

Coordinate polygon_center(const std::vector<Coordinate>& points) noexcept {
    if (points.empty()) {
        return Coordinate{};
    }

    double sum_lat = 0.0;
    double sum_lon = 0.0;
    for (const Coordinate& point : points) {
        sum_lat += point.latitude_deg;
        sum_lon += point.longitude_deg;
    }
    const auto count = static_cast<double>(points.size());
    return Coordinate{sum_lat / count, sum_lon / count};
}

// Shoelace formula in degree space; ignores curvature and the shrinking of a
// longitude degree away from the equator.
double polygon_area_km2(const std::vector<Coordinate>& points) noexcept {
    if (points.size() < 3) {
        return 0.0;
    }

    double area = 0.0;
    for (std::size_t index = 0; index < points.size(); ++index) {
        const Coordinate& current = points[index];
        const Coordinate& next = points[(index + 1) % points.size()];
        area += current.longitude_deg * next.latitude_deg;
        area -= next.longitude_deg * current.latitude_deg;
    }
    return std::abs(area) / 2.0 * k_km_per_degree * k_km_per_degree;
}

}  // namespace delivery_geofence
