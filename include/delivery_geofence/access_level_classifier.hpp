// === Access Level Classifier =================================================
//
// Port for the policy that turns a coordinate into an access tier, plus the
// zone-backed implementation used in production. The readiness check treats a
// classification as one opaque call; zone refreshes are the classifier's own
// business.

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "delivery_geofence/delivery_zone.hpp"
#include "delivery_geofence/logging.hpp"
#include "delivery_geofence/types.hpp"
#include "delivery_geofence/zone_detection.hpp"
#include "delivery_geofence/zone_geometry.hpp"

namespace delivery_geofence {

/** @brief The classifier could not produce an access level. */
class ClassificationError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Abstract coordinate-to-tier classification. */
class AccessLevelClassifier {
  public:
    virtual ~AccessLevelClassifier() = default;

    /**
     * @brief Classify @p coordinate.
     * @throws ClassificationError when classification is impossible.
     */
    virtual AccessLevel detect_access_level(const Coordinate& coordinate, std::stop_token stop_token) = 0;
};

using AccessLevelClassifierPtr = std::shared_ptr<AccessLevelClassifier>;

/** @brief Supplies the currently active delivery zones (typically a backend fetch). */
class ZoneSource {
  public:
    virtual ~ZoneSource() = default;

    virtual DeliveryZoneList load_active_zones() = 0;
};

using ZoneSourcePtr = std::shared_ptr<ZoneSource>;

/** @brief Zone source over an already-loaded in-memory catalog. */
class StaticZoneSource final : public ZoneSource {
  public:
    explicit StaticZoneSource(DeliveryZoneList zones);

    DeliveryZoneList load_active_zones() override;

  private:
    DeliveryZoneList list_zones_;
};

/** @brief Policy deciding which non-contained coordinates may still browse. */
struct AccessPolicy final {
    double viewing_radius_km{10.0};  /**< Nearest-zone distance up to which browsing is allowed. */
    PolygonDistanceMode polygon_distance_mode{PolygonDistanceMode::Vertex};
};

/** @brief Full classification outcome, for callers that need more than the tier. */
struct AccessLevelResult final {
    AccessLevel access_level{AccessLevel::NoAccess};
    ZoneDetectionResult detection{};
    std::optional<DeliveryZone> nearest_zone{};
    std::optional<double> nearest_zone_distance_km{};
    std::string message{};
};

/**
 * @brief Two-tier classifier over delivery zones.
 *
 * Contained in an active zone gives full access. Otherwise the nearest active
 * zone decides: within the policy's viewing radius the user may browse, beyond
 * it there is no access.
 */
class ZoneAccessClassifier final : public AccessLevelClassifier {
  public:
    ZoneAccessClassifier(ZoneSourcePtr zone_source, AccessPolicy policy);

    [[nodiscard]] const AccessPolicy& policy() const noexcept;

    /** @throws ClassificationError when the zone source fails. */
    [[nodiscard]] AccessLevelResult classify(const Coordinate& coordinate) const;

    AccessLevel detect_access_level(const Coordinate& coordinate, std::stop_token stop_token) override;

  private:
    ZoneSourcePtr zone_source_;
    AccessPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace delivery_geofence
