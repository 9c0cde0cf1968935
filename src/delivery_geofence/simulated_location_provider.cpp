#include "delivery_geofence/simulated_location_provider.hpp"

#include <condition_variable>
#include <mutex>
#include <utility>

namespace delivery_geofence {

namespace {

/**
 * @brief Sleep for @p delay unless @p stop_token fires first.
 * @return False when the wait was interrupted.
 */
bool interruptible_wait(Duration delay, std::stop_token stop_token) {
    if (delay.count() <= 0.0) {
        return !stop_token.stop_requested();
    }
    std::mutex mutex;
    std::condition_variable_any condition;
    std::unique_lock lock(mutex);
    // The predicate never holds, so this returns on timeout or stop request only.
    condition.wait_for(lock, stop_token, delay, [] { return false; });
    return !stop_token.stop_requested();
}

}  // namespace

SimulatedLocationProvider::SimulatedLocationProvider(SimulatedLocationConfig config)
    : config_(std::move(config)),
      permission_(config_.permission) {}

bool SimulatedLocationProvider::is_location_service_enabled(std::stop_token stop_token) {
    interruptible_wait(config_.service_check_delay, stop_token);
    return config_.service_enabled;
}

LocationPermission SimulatedLocationProvider::check_permission_status(std::stop_token stop_token) {
    ++permission_checks_;
    interruptible_wait(config_.permission_delay, stop_token);
    return permission_.load();
}

LocationPermission SimulatedLocationProvider::request_permission(std::stop_token stop_token) {
    LocationPermission permission = check_permission_status(stop_token);
    if (permission == LocationPermission::Denied) {
        if (!interruptible_wait(config_.permission_delay, stop_token)) {
            return permission;
        }
        permission = LocationPermission::WhileInUse;
        permission_.store(permission);
    }
    if (permission == LocationPermission::DeniedForever) {
        throw LocationPermissionDeniedError();
    }
    return permission;
}

std::optional<Coordinate> SimulatedLocationProvider::get_coordinate_only(std::stop_token stop_token) {
    ++coordinate_requests_;
    if (!interruptible_wait(config_.coordinate_delay, stop_token)) {
        return std::nullopt;
    }
    return config_.coordinate;
}

std::optional<LocationData> SimulatedLocationProvider::get_coordinate_with_address(std::stop_token stop_token) {
    ++address_requests_;
    if (!interruptible_wait(config_.address_delay, stop_token)) {
        return std::nullopt;
    }
    if (config_.address_lookup_fails) {
        throw LocationProviderError("Reverse geocoding unavailable");
    }
    if (!config_.coordinate.has_value() || !config_.address.has_value()) {
        return std::nullopt;
    }
    return LocationData{config_.coordinate.value(), config_.address};
}

int SimulatedLocationProvider::coordinate_requests() const noexcept {
    return coordinate_requests_.load();
}

int SimulatedLocationProvider::address_requests() const noexcept {
    return address_requests_.load();
}

int SimulatedLocationProvider::permission_checks() const noexcept {
    return permission_checks_.load();
}

}  // namespace delivery_geofence
