#include "delivery_geofence/zone_detection.hpp"

#include <algorithm>
#include <vector>

#include <fmt/format.h>

#include "delivery_geofence/zone_geometry.hpp"

namespace delivery_geofence {

namespace {
constexpr char k_not_found_message[] = "We don't deliver to this area yet, but we're expanding soon!";
}  // namespace

ZoneDetectionResult detect_zone(const Coordinate& point, const DeliveryZoneList& zones) {
    std::vector<const DeliveryZone*> list_candidates;
    list_candidates.reserve(zones.size());
    for (const DeliveryZone& zone : zones) {
        if (zone.is_active) {
            list_candidates.push_back(&zone);
        }
    }
    std::stable_sort(list_candidates.begin(), list_candidates.end(), [](const DeliveryZone* lhs, const DeliveryZone* rhs) {
        return lhs->priority > rhs->priority;
    });

    for (const DeliveryZone* zone : list_candidates) {
        if (zone->is_polygon() && !is_in_bounding_box(point, bounding_box(zone->boundary_coordinates))) {
            continue;
        }
        if (contains_point(point, *zone)) {
            return ZoneDetectionResult{
                true,
                *zone,
                point,
                fmt::format("Delivery available in {}", zone->name.empty() ? zone->identifier : zone->name)
            };
        }
    }

    return ZoneDetectionResult{false, std::nullopt, point, k_not_found_message};
}

}  // namespace delivery_geofence
