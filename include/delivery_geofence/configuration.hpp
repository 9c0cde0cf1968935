// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe logging, stage
// budgets, access policy, and the simulated device consumed across the
// library. `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "delivery_geofence/access_level_classifier.hpp"
#include "delivery_geofence/location_readiness.hpp"
#include "delivery_geofence/simulated_location_provider.hpp"

namespace delivery_geofence {

/**
 * @brief Immutable bundle of runtime knobs for a readiness check session.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};            /**< Destination directory for structured logs. */
    std::string log_level{};                /**< spdlog level name. */
    ReadinessTimeouts timeouts{};           /**< Per-stage budgets for the readiness check. */
    AccessPolicy access_policy{};           /**< Viewing-only policy for the zone classifier. */
    SimulatedLocationConfig simulation{};   /**< Script for the simulated device. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static ReadinessTimeouts load_timeouts();
    static SimulatedLocationConfig load_simulation();
};

}  // namespace delivery_geofence
