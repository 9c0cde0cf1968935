// === Location Readiness ======================================================
//
// Bounded-time startup pipeline that turns "the app just launched" into one
// terminal readiness status:
//
//   basic checks (GPS on, permission)  -> needsSetup on failure or timeout
//   coordinate fix (+ optional address) -> timeout when no fix arrives
//   zone validation (access classifier) -> ready or outOfService
//   anything unanticipated              -> error
//
// Stages run strictly in order and every blocking call is raced against its
// own budget. There is no retry inside one check; callers re-run the check,
// e.g. after the user returns from the settings screen.

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "delivery_geofence/access_level_classifier.hpp"
#include "delivery_geofence/location_provider.hpp"
#include "delivery_geofence/logging.hpp"
#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/** @brief Terminal state of one readiness check. */
enum class LocationReadinessStatus {
    Ready,         /**< GPS on, permission granted, coordinate obtained, inside a zone. */
    NeedsSetup,    /**< GPS off or permission missing. */
    OutOfService,  /**< Coordinate obtained but not serviceable, or zone check failed. */
    Error,         /**< Unanticipated failure. */
    Timeout        /**< No coordinate within the budget. */
};

[[nodiscard]] std::string_view to_string(LocationReadinessStatus status) noexcept;

/** @brief Disposable outcome of a single check. */
struct LocationReadinessResult final {
    LocationReadinessStatus status{LocationReadinessStatus::Error};
    std::optional<LocationData> location_data{};  /**< Present whenever a fix was obtained. */
    std::optional<std::string> error_message{};
    bool is_service_available{};                  /**< True only for Ready. */

    [[nodiscard]] bool is_ready() const noexcept;
    /** @brief Route to the location access screen (needsSetup, error, timeout). */
    [[nodiscard]] bool should_go_to_location_access() const noexcept;
    /** @brief Route to the service unavailable screen (outOfService). */
    [[nodiscard]] bool should_go_to_service_unavailable() const noexcept;
    [[nodiscard]] std::string to_string() const;
};

/** @brief Per-stage budgets. */
struct ReadinessTimeouts final {
    Duration basic_checks{Duration{2.0}};     /**< GPS service and permission queries. */
    Duration coordinate_fix{Duration{8.0}};   /**< Cold GPS fixes are slow. */
    Duration address_lookup{Duration{2.0}};   /**< Optional reverse geocoding. */
    Duration zone_validation{Duration{3.0}};  /**< May include a zone refresh round trip. */
};

/** @brief Orchestrates the readiness pipeline over injected collaborators. */
class LocationReadinessChecker final {
  public:
    LocationReadinessChecker(DeviceLocationProviderPtr location_provider,
                             AccessLevelClassifierPtr access_classifier,
                             ReadinessTimeouts timeouts = {});

    [[nodiscard]] const ReadinessTimeouts& timeouts() const noexcept;

    /** @brief Run the full pipeline. Never throws. */
    [[nodiscard]] LocationReadinessResult check_location_readiness() const;
    /** @brief Run the pipeline on a background thread. */
    [[nodiscard]] std::future<LocationReadinessResult> check_location_readiness_async() const;

  private:
    /** @brief Stage 1. Returns a terminal result when the check must stop here. */
    [[nodiscard]] std::optional<LocationReadinessResult> run_basic_checks() const;
    /** @brief Stage 2. Empty when no coordinate fix arrived in time. */
    [[nodiscard]] std::optional<LocationData> acquire_location() const;
    /** @brief Optional enrichment of a fix with an address. */
    [[nodiscard]] std::optional<LocationData> resolve_address() const;
    /** @brief Stage 3. */
    [[nodiscard]] LocationReadinessResult validate_zone(const LocationData& location_data) const;

    DeviceLocationProviderPtr location_provider_;
    AccessLevelClassifierPtr access_classifier_;
    ReadinessTimeouts timeouts_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace delivery_geofence
