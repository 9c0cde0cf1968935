#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "delivery_geofence/access_level_classifier.hpp"
#include "delivery_geofence/configuration.hpp"
#include "delivery_geofence/coordinate_parsing.hpp"
#include "delivery_geofence/delivery_zone.hpp"
#include "delivery_geofence/location_readiness.hpp"
#include "delivery_geofence/logging.hpp"
#include "delivery_geofence/simulated_location_provider.hpp"
#include "delivery_geofence/version.hpp"

namespace {

constexpr char k_tura_bazaar_kml[] =
    "90.2065,25.5138,0 90.2200,25.5138,0 90.2200,25.5250,0 90.2065,25.5250,0 90.2065,25.5138,0"; /**< Main bazaar boundary. */
constexpr delivery_geofence::Coordinate k_tura_center{25.5138, 90.2172};     /**< Tura town centre. */
constexpr delivery_geofence::Coordinate k_araimile_center{25.4950, 90.2330}; /**< Araimile, not yet launched. */

/**
 * @brief Sample catalog standing in for the backend zone fetch.
 */
delivery_geofence::DeliveryZoneList make_sample_zones() {
    using namespace delivery_geofence;

    DeliveryZoneList zones{};
    DeliveryZone bazaar = make_polygon_zone("tura-zone-1", "Tura Main Bazaar", parse_kml_coordinates(k_tura_bazaar_kml));
    bazaar.zone_number = 1;
    bazaar.priority = 2;
    zones.push_back(std::move(bazaar));

    DeliveryZone town = make_circle_zone("tura-zone-2", "Tura Town", k_tura_center, 5.0);
    town.zone_number = 2;
    zones.push_back(std::move(town));

    DeliveryZone araimile = make_circle_zone("tura-zone-3", "Araimile", k_araimile_center, 2.0, false);
    araimile.zone_number = 3;
    zones.push_back(std::move(araimile));
    return zones;
}

}  // namespace

int main() {
    using namespace delivery_geofence;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto logger = get_logger();
        logger->info("delivery_geofence {} readiness check", k_version);

        DeliveryZoneList zones = make_sample_zones();
        const ZoneValidationReport report = validate_zone_catalog(zones);
        for (const std::string& warning : report.warnings) {
            logger->warn("Zone catalog: {}", warning);
        }
        if (!report.is_valid()) {
            for (const std::string& issue : report.issues) {
                logger->error("Zone catalog: {}", issue);
            }
            throw std::runtime_error("Zone catalog failed validation");
        }
        logger->info("Zone catalog: {} zones ({} active)", report.zone_count, report.active_zone_count);

        auto provider = std::make_shared<SimulatedLocationProvider>(configuration.simulation);
        auto classifier = std::make_shared<ZoneAccessClassifier>(
            std::make_shared<StaticZoneSource>(std::move(zones)),
            configuration.access_policy
        );
        const LocationReadinessChecker checker{provider, classifier, configuration.timeouts};

        const LocationReadinessResult result = checker.check_location_readiness_async().get();
        logger->info("{}", result.to_string());
        if (result.location_data.has_value()) {
            logger->info("Resolved location ({}, {}) address: {}",
                         result.location_data->coordinate.latitude_deg,
                         result.location_data->coordinate.longitude_deg,
                         result.location_data->address.value_or("<unresolved>"));
        }
        if (result.error_message.has_value()) {
            logger->info("Reason: {}", result.error_message.value());
        }

        if (result.is_ready()) {
            logger->info("Route: home");
        } else if (result.should_go_to_service_unavailable()) {
            logger->info("Route: service unavailable");
        } else if (result.should_go_to_location_access()) {
            logger->info("Route: location access");
        }
        logger->flush();
    } catch (const std::exception& exc) {
        if (is_logger_initialized()) {
            get_logger()->critical("Fatal error: {}", exc.what());
        } else {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
