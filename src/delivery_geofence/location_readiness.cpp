#include "delivery_geofence/location_readiness.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "delivery_geofence/timeout_race.hpp"

namespace delivery_geofence {

namespace {

constexpr char k_gps_disabled_message[] = "GPS is disabled";
constexpr char k_permission_denied_message[] = "Location permission needs user approval";
constexpr char k_permission_denied_forever_message[] = "Location permission permanently denied";
constexpr char k_basic_checks_timeout_message[] = "GPS check timed out";
constexpr char k_coordinate_timeout_message[] = "Location detection timed out";
constexpr char k_out_of_service_message[] = "Service not available in your area";
constexpr char k_zone_validation_timeout_message[] = "Zone validation timed out";

/** @brief Stage 1 verdict; `reason` explains a refusal. */
struct BasicCheckOutcome final {
    bool can_proceed{};
    std::string reason{};
};

BasicCheckOutcome perform_basic_checks(DeviceLocationProvider& provider, std::stop_token stop_token) {
    if (!provider.is_location_service_enabled(stop_token)) {
        return BasicCheckOutcome{false, k_gps_disabled_message};
    }

    const LocationPermission permission = provider.check_permission_status(stop_token);
    switch (permission) {
        case LocationPermission::WhileInUse:
        case LocationPermission::Always:
            return BasicCheckOutcome{true, "All basic checks passed"};
        case LocationPermission::Denied:
            return BasicCheckOutcome{false, k_permission_denied_message};
        case LocationPermission::DeniedForever:
            return BasicCheckOutcome{false, k_permission_denied_forever_message};
    }
    return BasicCheckOutcome{false, "Unknown permission state"};
}

LocationReadinessResult make_result(LocationReadinessStatus status,
                                    std::optional<LocationData> location_data,
                                    std::optional<std::string> error_message) {
    LocationReadinessResult result{};
    result.status = status;
    result.location_data = std::move(location_data);
    result.error_message = std::move(error_message);
    result.is_service_available = status == LocationReadinessStatus::Ready;
    return result;
}

void require_positive(Duration budget, const char* stage) {
    if (!std::isfinite(budget.count()) || budget.count() <= 0.0) {
        throw std::invalid_argument(fmt::format("LocationReadinessChecker {} timeout must be positive and finite", stage));
    }
}

}  // namespace

std::string_view to_string(LocationReadinessStatus status) noexcept {
    switch (status) {
        case LocationReadinessStatus::Ready:
            return "ready";
        case LocationReadinessStatus::NeedsSetup:
            return "needsSetup";
        case LocationReadinessStatus::OutOfService:
            return "outOfService";
        case LocationReadinessStatus::Error:
            return "error";
        case LocationReadinessStatus::Timeout:
            return "timeout";
    }
    return "unknown";
}

bool LocationReadinessResult::is_ready() const noexcept {
    return status == LocationReadinessStatus::Ready;
}

bool LocationReadinessResult::should_go_to_location_access() const noexcept {
    return status == LocationReadinessStatus::NeedsSetup
        || status == LocationReadinessStatus::Error
        || status == LocationReadinessStatus::Timeout;
}

bool LocationReadinessResult::should_go_to_service_unavailable() const noexcept {
    return status == LocationReadinessStatus::OutOfService;
}

std::string LocationReadinessResult::to_string() const {
    return fmt::format("LocationReadinessResult(status: {}, hasLocation: {}, serviceAvailable: {})",
                       delivery_geofence::to_string(status),
                       location_data.has_value(),
                       is_service_available);
}

LocationReadinessChecker::LocationReadinessChecker(DeviceLocationProviderPtr location_provider,
                                                   AccessLevelClassifierPtr access_classifier,
                                                   ReadinessTimeouts timeouts)
    : location_provider_(std::move(location_provider)),
      access_classifier_(std::move(access_classifier)),
      timeouts_(timeouts),
      logger_(get_logger()) {
    if (location_provider_ == nullptr) {
        throw std::invalid_argument("LocationReadinessChecker requires a location provider");
    }
    if (access_classifier_ == nullptr) {
        throw std::invalid_argument("LocationReadinessChecker requires an access level classifier");
    }
    require_positive(timeouts_.basic_checks, "basic check");
    require_positive(timeouts_.coordinate_fix, "coordinate");
    require_positive(timeouts_.address_lookup, "address");
    require_positive(timeouts_.zone_validation, "zone validation");
}

const ReadinessTimeouts& LocationReadinessChecker::timeouts() const noexcept {
    return timeouts_;
}

LocationReadinessResult LocationReadinessChecker::check_location_readiness() const {
    try {
        const TimePoint started_at = SteadyClock::now();

        if (std::optional<LocationReadinessResult> setup_result = run_basic_checks(); setup_result.has_value()) {
            logger_->info("Location readiness: {} ({})",
                          delivery_geofence::to_string(setup_result->status),
                          setup_result->error_message.value_or(""));
            return std::move(setup_result.value());
        }

        std::optional<LocationData> location_data = acquire_location();
        if (!location_data.has_value()) {
            logger_->warn("Location readiness: timeout after {:.2f}s", Duration{SteadyClock::now() - started_at}.count());
            return make_result(LocationReadinessStatus::Timeout, std::nullopt, k_coordinate_timeout_message);
        }

        LocationReadinessResult result = validate_zone(location_data.value());
        logger_->info("Location readiness: {} in {:.2f}s",
                      delivery_geofence::to_string(result.status),
                      Duration{SteadyClock::now() - started_at}.count());
        return result;
    } catch (const std::exception& exc) {
        logger_->error("Location readiness check failed: {}", exc.what());
        return make_result(LocationReadinessStatus::Error,
                           std::nullopt,
                           fmt::format("Failed to check location: {}", exc.what()));
    } catch (...) {
        logger_->error("Location readiness check failed with a non-standard exception");
        return make_result(LocationReadinessStatus::Error, std::nullopt, "Failed to check location: unknown exception");
    }
}

std::future<LocationReadinessResult> LocationReadinessChecker::check_location_readiness_async() const {
    return std::async(std::launch::async, [checker = *this]() {
        return checker.check_location_readiness();
    });
}

std::optional<LocationReadinessResult> LocationReadinessChecker::run_basic_checks() const {
    logger_->debug("Readiness stage: basic checks (budget {:.2f}s)", timeouts_.basic_checks.count());

    std::optional<BasicCheckOutcome> outcome;
    try {
        outcome = race_with_timeout<BasicCheckOutcome>(
            [provider = location_provider_](std::stop_token stop_token) {
                return perform_basic_checks(*provider, stop_token);
            },
            timeouts_.basic_checks
        );
    } catch (const LocationProviderError& exc) {
        logger_->warn("Basic location checks failed: {}", exc.what());
        return make_result(LocationReadinessStatus::NeedsSetup,
                           std::nullopt,
                           fmt::format("Basic checks failed: {}", exc.what()));
    }

    if (!outcome.has_value()) {
        logger_->warn("Basic location checks exceeded {:.2f}s", timeouts_.basic_checks.count());
        return make_result(LocationReadinessStatus::NeedsSetup, std::nullopt, k_basic_checks_timeout_message);
    }
    if (!outcome->can_proceed) {
        return make_result(LocationReadinessStatus::NeedsSetup, std::nullopt, outcome->reason);
    }
    return std::nullopt;
}

std::optional<LocationData> LocationReadinessChecker::acquire_location() const {
    logger_->debug("Readiness stage: coordinate acquisition (budget {:.2f}s)", timeouts_.coordinate_fix.count());

    std::optional<std::optional<Coordinate>> fix;
    try {
        fix = race_with_timeout<std::optional<Coordinate>>(
            [provider = location_provider_](std::stop_token stop_token) {
                return provider->get_coordinate_only(stop_token);
            },
            timeouts_.coordinate_fix
        );
    } catch (const LocationProviderError& exc) {
        logger_->warn("Coordinate fix failed: {}", exc.what());
        return std::nullopt;
    }

    if (!fix.has_value()) {
        logger_->warn("Coordinate fix exceeded {:.2f}s", timeouts_.coordinate_fix.count());
        return std::nullopt;
    }
    if (!fix->has_value()) {
        logger_->warn("Location provider returned no coordinate");
        return std::nullopt;
    }

    if (std::optional<LocationData> enriched = resolve_address(); enriched.has_value()) {
        return enriched;
    }
    return LocationData{fix->value(), std::nullopt};
}

std::optional<LocationData> LocationReadinessChecker::resolve_address() const {
    try {
        std::optional<std::optional<LocationData>> enriched = race_with_timeout<std::optional<LocationData>>(
            [provider = location_provider_](std::stop_token stop_token) {
                return provider->get_coordinate_with_address(stop_token);
            },
            timeouts_.address_lookup
        );
        if (!enriched.has_value()) {
            logger_->debug("Address lookup exceeded {:.2f}s; continuing with bare coordinate", timeouts_.address_lookup.count());
            return std::nullopt;
        }
        return enriched.value();
    } catch (const LocationProviderError& exc) {
        logger_->debug("Address lookup failed ({}); continuing with bare coordinate", exc.what());
        return std::nullopt;
    }
}

LocationReadinessResult LocationReadinessChecker::validate_zone(const LocationData& location_data) const {
    logger_->debug("Readiness stage: zone validation (budget {:.2f}s)", timeouts_.zone_validation.count());

    std::optional<AccessLevel> access_level;
    try {
        access_level = race_with_timeout<AccessLevel>(
            [classifier = access_classifier_, coordinate = location_data.coordinate](std::stop_token stop_token) {
                return classifier->detect_access_level(coordinate, stop_token);
            },
            timeouts_.zone_validation
        );
    } catch (const std::exception& exc) {
        logger_->warn("Zone validation failed: {}", exc.what());
        return make_result(LocationReadinessStatus::OutOfService,
                           location_data,
                           fmt::format("Zone validation failed: {}", exc.what()));
    }

    if (!access_level.has_value()) {
        logger_->warn("Zone validation exceeded {:.2f}s", timeouts_.zone_validation.count());
        return make_result(LocationReadinessStatus::OutOfService, location_data, k_zone_validation_timeout_message);
    }

    logger_->debug("Access level for ({}, {}) is {}",
                   location_data.coordinate.latitude_deg,
                   location_data.coordinate.longitude_deg,
                   delivery_geofence::to_string(access_level.value()));
    if (access_level.value() == AccessLevel::FullAccess) {
        return make_result(LocationReadinessStatus::Ready, location_data, std::nullopt);
    }
    return make_result(LocationReadinessStatus::OutOfService, location_data, k_out_of_service_message);
}

}  // namespace delivery_geofence
