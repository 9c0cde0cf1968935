#include "delivery_geofence/access_level_classifier.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace delivery_geofence {

namespace {
constexpr char k_viewing_only_message[] = "You can browse products, but delivery is not available at your location yet";
constexpr char k_no_access_message[] = "We don't serve this area yet";
}  // namespace

StaticZoneSource::StaticZoneSource(DeliveryZoneList zones)
    : list_zones_(std::move(zones)) {}

DeliveryZoneList StaticZoneSource::load_active_zones() {
    DeliveryZoneList list_active;
    for (const DeliveryZone& zone : list_zones_) {
        if (zone.is_active) {
            list_active.push_back(zone);
        }
    }
    return list_active;
}

ZoneAccessClassifier::ZoneAccessClassifier(ZoneSourcePtr zone_source, AccessPolicy policy)
    : zone_source_(std::move(zone_source)),
      policy_(policy),
      logger_(get_logger()) {
    if (zone_source_ == nullptr) {
        throw std::invalid_argument("ZoneAccessClassifier requires a zone source");
    }
    if (policy_.viewing_radius_km < 0.0) {
        throw std::invalid_argument("ZoneAccessClassifier viewing radius cannot be negative");
    }
}

const AccessPolicy& ZoneAccessClassifier::policy() const noexcept {
    return policy_;
}

AccessLevelResult ZoneAccessClassifier::classify(const Coordinate& coordinate) const {
    DeliveryZoneList list_zones;
    try {
        list_zones = zone_source_->load_active_zones();
    } catch (const std::exception& exc) {
        throw ClassificationError(fmt::format("Failed to load delivery zones: {}", exc.what()));
    }

    AccessLevelResult result{};
    result.detection = detect_zone(coordinate, list_zones);
    if (result.detection.is_in_zone) {
        result.access_level = AccessLevel::FullAccess;
        result.message = result.detection.message;
        logger_->debug("Coordinate ({}, {}) inside zone {}",
                       coordinate.latitude_deg,
                       coordinate.longitude_deg,
                       result.detection.zone->identifier);
        return result;
    }

    result.nearest_zone = find_closest_zone(coordinate, list_zones, policy_.polygon_distance_mode);
    if (result.nearest_zone.has_value()) {
        result.nearest_zone_distance_km = distance_to_zone_km(coordinate, result.nearest_zone.value(), policy_.polygon_distance_mode);
    }

    if (result.nearest_zone_distance_km.has_value() && result.nearest_zone_distance_km.value() <= policy_.viewing_radius_km) {
        result.access_level = AccessLevel::ViewingOnly;
        result.message = k_viewing_only_message;
    } else {
        result.access_level = AccessLevel::NoAccess;
        result.message = k_no_access_message;
    }

    logger_->debug("Coordinate ({}, {}) outside all zones; nearest {} at {} km -> {}",
                   coordinate.latitude_deg,
                   coordinate.longitude_deg,
                   result.nearest_zone.has_value() ? result.nearest_zone->identifier : std::string{"<none>"},
                   result.nearest_zone_distance_km.value_or(-1.0),
                   to_string(result.access_level));
    return result;
}

AccessLevel ZoneAccessClassifier::detect_access_level(const Coordinate& coordinate, std::stop_token stop_token) {
    if (stop_token.stop_requested()) {
        throw ClassificationError("Access level detection cancelled");
    }
    return classify(coordinate).access_level;
}

}  // namespace delivery_geofence
