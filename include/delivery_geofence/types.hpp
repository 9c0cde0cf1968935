// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the geofencing library (time primitives, coordinates, access tiers, device
// permission states).

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

namespace delivery_geofence {

/**
 * @brief Alias for the steady clock used for stage budgets.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Immutable latitude/longitude pair in decimal degrees.
 */
struct Coordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    friend bool operator==(const Coordinate&, const Coordinate&) = default;
};

/**
 * @brief Axis-aligned bounds of a coordinate set, in degrees.
 */
struct BoundingBox final {
    double min_latitude_deg{};
    double max_latitude_deg{};
    double min_longitude_deg{};
    double max_longitude_deg{};
};

/**
 * @brief Shape payload selector for a delivery zone.
 */
enum class ZoneType {
    Polygon,  /**< Irregular area described by a boundary ring. */
    Circle    /**< Centre plus radius, used for flat urban areas. */
};

/**
 * @brief Tiered relationship between a coordinate and the zone set.
 */
enum class AccessLevel {
    FullAccess,   /**< Inside at least one active zone; ordering allowed. */
    ViewingOnly,  /**< Outside every zone but close enough to browse. */
    NoAccess      /**< Outside the service area entirely. */
};

/**
 * @brief Device location permission as reported by the platform.
 *
 * `Denied` and `DeniedForever` are kept apart even though the readiness check
 * maps both to the same status; UI flows route them differently.
 */
enum class LocationPermission {
    WhileInUse,
    Always,
    Denied,
    DeniedForever
};

[[nodiscard]] std::string_view to_string(ZoneType zone_type) noexcept;
[[nodiscard]] std::string_view to_string(AccessLevel access_level) noexcept;
[[nodiscard]] std::string_view to_string(LocationPermission permission) noexcept;

/** @brief True for the two granted permission states. */
[[nodiscard]] constexpr bool is_permission_granted(LocationPermission permission) noexcept {
    return permission == LocationPermission::WhileInUse || permission == LocationPermission::Always;
}

}  // namespace delivery_geofence

template <>
struct std::hash<delivery_geofence::Coordinate> {
    std::size_t operator()(const delivery_geofence::Coordinate& coordinate) const noexcept {
        const std::size_t lat_hash = std::hash<double>{}(coordinate.latitude_deg);
        const std::size_t lon_hash = std::hash<double>{}(coordinate.longitude_deg);
        return lat_hash ^ (lon_hash + 0x9e3779b97f4a7c15ULL + (lat_hash << 6) + (lat_hash >> 2));
    }
};
