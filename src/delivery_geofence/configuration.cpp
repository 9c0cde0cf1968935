// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings for the
// readiness check. Unset variables take their defaults; values that cannot be
// parsed or fall outside their range are reported through the logger and
// replaced by the default.

#include "delivery_geofence/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "delivery_geofence/logging.hpp"

namespace delivery_geofence {

namespace {
constexpr double k_default_basic_check_timeout_s{2.0};
constexpr double k_default_coordinate_timeout_s{8.0};
constexpr double k_default_address_timeout_s{2.0};
constexpr double k_default_zone_validation_timeout_s{3.0};
constexpr double k_default_viewing_radius_km{10.0};
constexpr Coordinate k_default_sim_coordinate{25.5138, 90.2172}; /**< Tura main bazaar. */
constexpr std::string_view k_default_sim_address{"Main Bazaar, Tura"};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

std::string read_string(const char* variable, std::string_view fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::string read_log_level(const char* variable, std::string_view fallback) {
    std::string level_name = read_string(variable, fallback);
    if (!parse_log_level(level_name).has_value()) {
        get_logger()->warn("Unknown {}={}; using fallback {}", variable, level_name, fallback);
        return std::string{fallback};
    }
    return level_name;
}

double parse_positive_double(const char* variable, double fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value) || parsed_value <= 0.0) {
            get_logger()->warn("{}={} must be positive and finite; using fallback {}", variable, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a number; using fallback {}", variable, raw_value, fallback);
        return fallback;
    }
}

double parse_bounded_double(const char* variable, double fallback, double lower, double upper) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        // Inclusive form so NaN lands outside the range.
        if (!(parsed_value >= lower && parsed_value <= upper)) {
            get_logger()->warn("{}={} is outside [{}, {}]; using fallback {}", variable, raw_value, lower, upper, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a number; using fallback {}", variable, raw_value, fallback);
        return fallback;
    }
}

bool parse_bool(const char* variable, bool fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string lowered{raw_value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse {}={} as a boolean; using fallback {}", variable, raw_value, fallback);
    return fallback;
}

LocationPermission parse_permission(const char* variable, LocationPermission fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    for (const LocationPermission candidate : {LocationPermission::WhileInUse,
                                               LocationPermission::Always,
                                               LocationPermission::Denied,
                                               LocationPermission::DeniedForever}) {
        if (to_string(candidate) == raw_value) {
            return candidate;
        }
    }
    get_logger()->warn("Unknown {}={}; using fallback {}", variable, raw_value, to_string(fallback));
    return fallback;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = read_string("GEOFENCE_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = read_log_level("GEOFENCE_LOG_LEVEL", k_default_log_level);
    config.timeouts = load_timeouts();
    config.access_policy.viewing_radius_km = parse_positive_double("GEOFENCE_VIEWING_RADIUS_KM", k_default_viewing_radius_km);
    config.simulation = load_simulation();

    logger->info("Configuration loaded: timeouts basic={}s coordinate={}s address={}s zone={}s viewing_radius_km={}",
                 config.timeouts.basic_checks.count(),
                 config.timeouts.coordinate_fix.count(),
                 config.timeouts.address_lookup.count(),
                 config.timeouts.zone_validation.count(),
                 config.access_policy.viewing_radius_km);

    return config;
}

ReadinessTimeouts ConfigurationLoader::load_timeouts() {
    ReadinessTimeouts timeouts{};
    timeouts.basic_checks = Duration{parse_positive_double("GEOFENCE_BASIC_CHECK_TIMEOUT_S", k_default_basic_check_timeout_s)};
    timeouts.coordinate_fix = Duration{parse_positive_double("GEOFENCE_COORDINATE_TIMEOUT_S", k_default_coordinate_timeout_s)};
    timeouts.address_lookup = Duration{parse_positive_double("GEOFENCE_ADDRESS_TIMEOUT_S", k_default_address_timeout_s)};
    timeouts.zone_validation = Duration{parse_positive_double("GEOFENCE_ZONE_VALIDATION_TIMEOUT_S", k_default_zone_validation_timeout_s)};
    return timeouts;
}

SimulatedLocationConfig ConfigurationLoader::load_simulation() {
    SimulatedLocationConfig simulation{};
    simulation.service_enabled = parse_bool("GEOFENCE_SIM_GPS_ENABLED", true);
    simulation.permission = parse_permission("GEOFENCE_SIM_PERMISSION", LocationPermission::WhileInUse);
    simulation.coordinate = Coordinate{
        parse_bounded_double("GEOFENCE_SIM_LATITUDE", k_default_sim_coordinate.latitude_deg, -90.0, 90.0),
        parse_bounded_double("GEOFENCE_SIM_LONGITUDE", k_default_sim_coordinate.longitude_deg, -180.0, 180.0)
    };
    simulation.address = read_string("GEOFENCE_SIM_ADDRESS", k_default_sim_address);
    return simulation;
}

}  // namespace delivery_geofence
