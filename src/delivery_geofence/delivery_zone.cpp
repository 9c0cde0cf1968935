#include "delivery_geofence/delivery_zone.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "delivery_geofence/zone_geometry.hpp"

namespace delivery_geofence {

namespace {

std::string join_issues(const std::vector<std::string>& issues) {
    std::string joined;
    for (const std::string& issue : issues) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += issue;
    }
    return joined;
}

void throw_if_invalid(const DeliveryZone& zone) {
    const std::vector<std::string> issues = zone_issues(zone);
    if (!issues.empty()) {
        throw std::invalid_argument(fmt::format("Invalid delivery zone '{}': {}", zone.identifier, join_issues(issues)));
    }
}

}  // namespace

DeliveryZone make_polygon_zone(std::string identifier, std::string name, std::vector<Coordinate> boundary, bool is_active) {
    DeliveryZone zone{};
    zone.identifier = std::move(identifier);
    zone.name = std::move(name);
    zone.is_active = is_active;
    zone.zone_type = ZoneType::Polygon;
    zone.boundary_coordinates = std::move(boundary);
    throw_if_invalid(zone);
    return zone;
}

DeliveryZone make_circle_zone(std::string identifier, std::string name, Coordinate center, double radius_km, bool is_active) {
    DeliveryZone zone{};
    zone.identifier = std::move(identifier);
    zone.name = std::move(name);
    zone.is_active = is_active;
    zone.zone_type = ZoneType::Circle;
    zone.center = center;
    zone.radius_km = radius_km;
    throw_if_invalid(zone);
    return zone;
}

std::vector<std::string> zone_issues(const DeliveryZone& zone) {
    std::vector<std::string> issues;
    if (zone.identifier.empty()) {
        issues.emplace_back("zone identifier is empty");
    }

    switch (zone.zone_type) {
        case ZoneType::Polygon:
            if (zone.boundary_coordinates.size() < 3) {
                issues.push_back(fmt::format("polygon needs at least 3 points, got {}", zone.boundary_coordinates.size()));
            }
            for (std::size_t index = 0; index < zone.boundary_coordinates.size(); ++index) {
                const Coordinate& vertex = zone.boundary_coordinates[index];
                if (!is_valid_coordinate(vertex)) {
                    issues.push_back(fmt::format("vertex {} ({}, {}) is out of range",
                                                 index,
                                                 vertex.latitude_deg,
                                                 vertex.longitude_deg));
                }
            }
            if (zone.center.has_value() || zone.radius_km.has_value()) {
                issues.emplace_back("polygon zone carries a circle payload");
            }
            break;
        case ZoneType::Circle:
            if (!zone.center.has_value() || !zone.radius_km.has_value()) {
                issues.emplace_back("circle zone is missing its center or radius");
            } else if (!validate_circle(zone.center.value(), zone.radius_km.value())) {
                issues.push_back(fmt::format("circle at ({}, {}) with radius {} km is out of range",
                                             zone.center->latitude_deg,
                                             zone.center->longitude_deg,
                                             zone.radius_km.value()));
            }
            if (!zone.boundary_coordinates.empty()) {
                issues.emplace_back("circle zone carries a polygon payload");
            }
            break;
    }
    return issues;
}

ZoneValidationReport validate_zone_catalog(const DeliveryZoneList& zones) {
    ZoneValidationReport report{};
    report.zone_count = zones.size();

    std::unordered_set<std::string> set_seen_identifiers;
    for (const DeliveryZone& zone : zones) {
        const std::string label = zone.name.empty() ? zone.identifier : zone.name;

        for (const std::string& issue : zone_issues(zone)) {
            report.issues.push_back(fmt::format("{}: {}", label, issue));
        }
        if (!zone.identifier.empty() && !set_seen_identifiers.insert(zone.identifier).second) {
            report.issues.push_back(fmt::format("{}: duplicate zone identifier {}", label, zone.identifier));
        }

        if (zone.is_active) {
            ++report.active_zone_count;
        } else {
            report.warnings.push_back(fmt::format("{}: zone is inactive", label));
        }
        if (zone.is_polygon() && zone.boundary_coordinates.size() >= 3 && !validate_polygon(zone.boundary_coordinates)) {
            report.warnings.push_back(fmt::format("{}: polygon ring is not closed", label));
        }
    }

    if (report.active_zone_count == 0) {
        report.warnings.emplace_back("catalog has no active zones");
    }
    return report;
}

}  // namespace delivery_geofence
