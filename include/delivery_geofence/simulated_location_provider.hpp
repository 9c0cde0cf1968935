// === Simulated Location Provider =============================================
//
// Scripted stand-in for platform location services, used for development runs
// without a device and throughout the test suite. Each call can be delayed;
// delays end early once the caller's stop token fires.

#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "delivery_geofence/location_provider.hpp"
#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/** @brief Script for the simulated device. */
struct SimulatedLocationConfig final {
    bool service_enabled{true};
    LocationPermission permission{LocationPermission::WhileInUse};
    std::optional<Coordinate> coordinate{};  /**< Empty simulates a fix that never resolves. */
    std::optional<std::string> address{};    /**< Empty simulates a geocoder with no answer. */
    bool address_lookup_fails{};             /**< Geocoder raises instead of answering. */
    Duration service_check_delay{};
    Duration permission_delay{};
    Duration coordinate_delay{};
    Duration address_delay{};
};

/** @brief DeviceLocationProvider driven by a SimulatedLocationConfig. */
class SimulatedLocationProvider final : public DeviceLocationProvider {
  public:
    explicit SimulatedLocationProvider(SimulatedLocationConfig config);

    bool is_location_service_enabled(std::stop_token stop_token) override;
    LocationPermission check_permission_status(std::stop_token stop_token) override;
    LocationPermission request_permission(std::stop_token stop_token) override;
    std::optional<Coordinate> get_coordinate_only(std::stop_token stop_token) override;
    std::optional<LocationData> get_coordinate_with_address(std::stop_token stop_token) override;

    /** @brief Number of `get_coordinate_only` calls so far. */
    [[nodiscard]] int coordinate_requests() const noexcept;
    /** @brief Number of `get_coordinate_with_address` calls so far. */
    [[nodiscard]] int address_requests() const noexcept;
    /** @brief Number of `check_permission_status` calls so far. */
    [[nodiscard]] int permission_checks() const noexcept;

  private:
    SimulatedLocationConfig config_;
    std::atomic<LocationPermission> permission_;
    std::atomic<int> coordinate_requests_{0};
    std::atomic<int> address_requests_{0};
    std::atomic<int> permission_checks_{0};
};

}  // namespace delivery_geofence
