// === Device Location Provider ================================================
//
// Port for the platform location services consumed by the readiness check.
// Every call may block on the device; implementations should return promptly
// once the supplied stop token is signalled, since a caller that has timed
// out discards whatever the call produces afterwards.

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/** @brief A resolved position with an optional reverse-geocoded address. */
struct LocationData final {
    Coordinate coordinate{};
    std::optional<std::string> address{};
};

/** @brief The provider could not answer (platform failure, geocoder down, ...). */
class LocationProviderError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Permission was refused and blocked; only the system settings can lift it. */
class LocationPermissionDeniedError final : public LocationProviderError {
  public:
    LocationPermissionDeniedError()
        : LocationProviderError("Location permission permanently denied") {}
};

/** @brief Abstract access to GPS state, permission, and position fixes. */
class DeviceLocationProvider {
  public:
    virtual ~DeviceLocationProvider() = default;

    /** @brief Whether the device-wide location service is switched on. */
    virtual bool is_location_service_enabled(std::stop_token stop_token) = 0;
    /** @brief Current permission without prompting the user. */
    virtual LocationPermission check_permission_status(std::stop_token stop_token) = 0;
    /**
     * @brief Prompt for permission when possible.
     * @throws LocationPermissionDeniedError when permanently denied.
     */
    virtual LocationPermission request_permission(std::stop_token stop_token) = 0;
    /** @brief Position fix without any network dependency. */
    virtual std::optional<Coordinate> get_coordinate_only(std::stop_token stop_token) = 0;
    /** @brief Position fix enriched with an address; may hit the network. */
    virtual std::optional<LocationData> get_coordinate_with_address(std::stop_token stop_token) = 0;
};

using DeviceLocationProviderPtr = std::shared_ptr<DeviceLocationProvider>;

}  // namespace delivery_geofence
