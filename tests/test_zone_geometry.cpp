#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "delivery_geofence/delivery_zone.hpp"
#include "delivery_geofence/zone_geometry.hpp"

using namespace delivery_geofence;

namespace {

std::vector<Coordinate> unit_square() {
    return {{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 0.0}};
}

DeliveryZone polygon_zone(std::vector<Coordinate> boundary, bool is_active = true) {
    DeliveryZone zone{};
    zone.identifier = "polygon";
    zone.zone_type = ZoneType::Polygon;
    zone.boundary_coordinates = std::move(boundary);
    zone.is_active = is_active;
    return zone;
}

DeliveryZone circle_zone(const std::string& identifier, Coordinate center, double radius_km, bool is_active = true) {
    DeliveryZone zone{};
    zone.identifier = identifier;
    zone.zone_type = ZoneType::Circle;
    zone.center = center;
    zone.radius_km = radius_km;
    zone.is_active = is_active;
    return zone;
}

constexpr Coordinate k_tura_center{25.5138, 90.2172};

}  // namespace

TEST_CASE("Haversine distance matches one degree of arc on the equator") {
    const double one_degree_km = k_earth_radius_km * std::numbers::pi / 180.0;
    REQUIRE(haversine_distance_km({0.0, 0.0}, {0.0, 1.0}) == Approx(one_degree_km).epsilon(1e-9));
    REQUIRE(haversine_distance_km({0.0, 0.0}, {1.0, 0.0}) == Approx(one_degree_km).epsilon(1e-9));
    REQUIRE(haversine_distance_km(k_tura_center, k_tura_center) == Approx(0.0).margin(1e-12));
}

TEST_CASE("Square polygon contains its centre and excludes far points") {
    const DeliveryZone square = polygon_zone(unit_square());

    REQUIRE(contains_point({0.5, 0.5}, square));
    REQUIRE_FALSE(contains_point({2.0, 2.0}, square));
    REQUIRE_FALSE(contains_point({-0.5, 0.5}, square));
    REQUIRE_FALSE(contains_point({0.5, 1.5}, square));
}

TEST_CASE("Open polygon rings are tolerated by containment") {
    const DeliveryZone open_square = polygon_zone({{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {1.0, 0.0}});

    REQUIRE(contains_point({0.5, 0.5}, open_square));
    REQUIRE_FALSE(contains_point({2.0, 2.0}, open_square));
}

TEST_CASE("Points strictly inside a convex pentagon are contained") {
    const DeliveryZone pentagon = polygon_zone({
        {25.50, 90.20}, {25.50, 90.24}, {25.53, 90.25}, {25.55, 90.22}, {25.53, 90.19}, {25.50, 90.20}
    });

    for (const Coordinate& probe : {Coordinate{25.52, 90.22}, Coordinate{25.51, 90.21}, Coordinate{25.54, 90.22}, Coordinate{25.505, 90.235}}) {
        INFO("probe " << probe.latitude_deg << ", " << probe.longitude_deg);
        REQUIRE(contains_point(probe, pentagon));
    }
    REQUIRE_FALSE(contains_point({26.0, 91.0}, pentagon));
    REQUIRE_FALSE(contains_point({25.0, 90.22}, pentagon));
}

TEST_CASE("Concave polygon excludes its notch") {
    // U shape opening towards higher latitudes.
    const DeliveryZone u_shape = polygon_zone({
        {0.0, 0.0}, {0.0, 3.0}, {3.0, 3.0}, {3.0, 2.0}, {1.0, 2.0}, {1.0, 1.0}, {3.0, 1.0}, {3.0, 0.0}, {0.0, 0.0}
    });

    REQUIRE(contains_point({0.5, 1.5}, u_shape));
    REQUIRE(contains_point({2.0, 0.5}, u_shape));
    REQUIRE(contains_point({2.0, 2.5}, u_shape));
    REQUIRE_FALSE(contains_point({2.0, 1.5}, u_shape));
}

TEST_CASE("Degenerate polygons never contain") {
    REQUIRE_FALSE(contains_point({0.0, 0.0}, polygon_zone({})));
    REQUIRE_FALSE(contains_point({0.5, 0.5}, polygon_zone({{0.0, 0.0}, {1.0, 1.0}})));
}

TEST_CASE("Circle containment follows the great-circle distance") {
    const DeliveryZone town = circle_zone("tura", k_tura_center, 5.0);

    const Coordinate near_probe{25.52, 90.22};
    const Coordinate far_probe{25.60, 90.30};

    REQUIRE(haversine_distance_km(near_probe, k_tura_center) < 1.0);
    REQUIRE(contains_point(near_probe, town));

    REQUIRE(haversine_distance_km(far_probe, k_tura_center) > 12.0);
    REQUIRE_FALSE(contains_point(far_probe, town));

    for (const Coordinate& probe : {near_probe, far_probe, Coordinate{25.55, 90.25}, Coordinate{25.48, 90.19}}) {
        REQUIRE(contains_point(probe, town) == (haversine_distance_km(probe, k_tura_center) <= 5.0));
    }
}

TEST_CASE("Circle boundary is inclusive") {
    const Coordinate probe{25.55, 90.25};
    const double exact_radius = haversine_distance_km(probe, k_tura_center);

    REQUIRE(contains_point(probe, circle_zone("edge", k_tura_center, exact_radius)));
    REQUIRE_FALSE(contains_point(probe, circle_zone("inner", k_tura_center, std::nextafter(exact_radius, 0.0))));
}

TEST_CASE("Inactive zones never contain") {
    REQUIRE_FALSE(contains_point({0.5, 0.5}, polygon_zone(unit_square(), false)));
    REQUIRE_FALSE(contains_point(k_tura_center, circle_zone("off", k_tura_center, 5.0, false)));
}

TEST_CASE("Circle zones without a payload are non-containing and infinitely far") {
    DeliveryZone broken = circle_zone("broken", k_tura_center, 5.0);
    broken.radius_km.reset();

    REQUIRE_FALSE(contains_point(k_tura_center, broken));
    REQUIRE(std::isinf(distance_to_zone_km(k_tura_center, broken)));
    REQUIRE_FALSE(find_closest_zone(k_tura_center, {broken}).has_value());
}

TEST_CASE("Closest zone over an empty list is none") {
    REQUIRE_FALSE(find_closest_zone(k_tura_center, {}).has_value());
}

TEST_CASE("Closest zone ignores inactive candidates") {
    const DeliveryZone inactive_near = circle_zone("inactive-near", {25.52, 90.22}, 1.0, false);
    const DeliveryZone active_far = circle_zone("active-far", {26.20, 91.70}, 5.0);

    const auto closest = find_closest_zone(k_tura_center, {inactive_near, active_far});
    REQUIRE(closest.has_value());
    REQUIRE(closest->identifier == "active-far");

    REQUIRE_FALSE(find_closest_zone(k_tura_center, {inactive_near}).has_value());
}

TEST_CASE("Closest zone picks the nearer of two circles") {
    const DeliveryZone tura = circle_zone("tura", k_tura_center, 5.0);
    const DeliveryZone distant = circle_zone("distant", {26.20, 91.70}, 5.0);
    const Coordinate probe{25.60, 90.30};

    const auto closest = find_closest_zone(probe, {distant, tura});
    REQUIRE(closest.has_value());
    REQUIRE(closest->identifier == "tura");
}

TEST_CASE("Polygon distance modes differ near long edges") {
    DeliveryZone wide = polygon_zone({{0.0, 0.0}, {0.0, 10.0}, {10.0, 10.0}, {10.0, 0.0}, {0.0, 0.0}});
    wide.identifier = "wide";
    const DeliveryZone small_circle = circle_zone("circle", {-1.0, 5.0}, 1.0);
    const Coordinate probe{-0.1, 5.0};

    const double vertex_distance = distance_to_zone_km(probe, wide, PolygonDistanceMode::Vertex);
    const double edge_distance = distance_to_zone_km(probe, wide, PolygonDistanceMode::Edge);
    REQUIRE(vertex_distance > 500.0);
    REQUIRE(edge_distance == Approx(haversine_distance_km(probe, {0.0, 5.0})).epsilon(1e-6));

    REQUIRE(find_closest_zone(probe, {wide, small_circle})->identifier == "circle");
    REQUIRE(find_closest_zone(probe, {wide, small_circle}, PolygonDistanceMode::Edge)->identifier == "wide");
}

TEST_CASE("Polygon validation requires three points and a closed ring") {
    REQUIRE_FALSE(validate_polygon({}));
    REQUIRE_FALSE(validate_polygon({{0.0, 0.0}, {0.0, 0.0}}));
    REQUIRE(validate_polygon({{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {0.0, 0.0}}));
    REQUIRE_FALSE(validate_polygon({{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}}));

    // About 5 m apart is still closed; about 20 m apart is not.
    REQUIRE(validate_polygon({{25.5138, 90.2065}, {25.5145, 90.2070}, {25.5142, 90.2075}, {25.51384, 90.2065}}));
    REQUIRE_FALSE(validate_polygon({{25.5138, 90.2065}, {25.5145, 90.2070}, {25.5142, 90.2075}, {25.5140, 90.2065}}));
}

TEST_CASE("Circle validation checks radius and coordinate ranges") {
    REQUIRE(validate_circle(k_tura_center, 5.0));
    REQUIRE(validate_circle(k_tura_center, 50.0));
    REQUIRE(validate_circle({-90.0, 180.0}, 1.0));
    REQUIRE_FALSE(validate_circle(k_tura_center, 0.1));
    REQUIRE_FALSE(validate_circle(k_tura_center, 0.0));
    REQUIRE_FALSE(validate_circle(k_tura_center, -3.0));
    REQUIRE_FALSE(validate_circle(k_tura_center, 50.01));
    REQUIRE_FALSE(validate_circle({90.5, 0.0}, 1.0));
    REQUIRE_FALSE(validate_circle({-90.5, 0.0}, 1.0));
    REQUIRE_FALSE(validate_circle({0.0, 180.5}, 1.0));
    REQUIRE_FALSE(validate_circle({0.0, -181.0}, 1.0));

    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_FALSE(validate_circle({25.0, nan}, 5.0));
    REQUIRE_FALSE(validate_circle({nan, 90.0}, 5.0));
    REQUIRE_FALSE(validate_circle(k_tura_center, nan));
    REQUIRE_FALSE(validate_circle(k_tura_center, std::numeric_limits<double>::infinity()));
}

TEST_CASE("Coordinate range check is inclusive and rejects non-finite values") {
    REQUIRE(is_valid_coordinate({90.0, -180.0}));
    REQUIRE(is_valid_coordinate(k_tura_center));
    REQUIRE_FALSE(is_valid_coordinate({200.0, 0.0}));
    REQUIRE_FALSE(is_valid_coordinate({0.0, 500.0}));
    REQUIRE_FALSE(is_valid_coordinate({std::numeric_limits<double>::quiet_NaN(), 0.0}));
    REQUIRE_FALSE(is_valid_coordinate({0.0, std::numeric_limits<double>::infinity()}));
}

TEST_CASE("Bounding box covers every vertex") {
    const std::vector<Coordinate> points{{25.50, 90.20}, {25.55, 90.19}, {25.53, 90.25}};
    const BoundingBox box = bounding_box(points);

    REQUIRE(box.min_latitude_deg == Approx(25.50));
    REQUIRE(box.max_latitude_deg == Approx(25.55));
    REQUIRE(box.min_longitude_deg == Approx(90.19));
    REQUIRE(box.max_longitude_deg == Approx(90.25));

    for (const Coordinate& point : points) {
        REQUIRE(is_in_bounding_box(point, box));
    }
    REQUIRE(is_in_bounding_box({25.52, 90.22}, box));
    REQUIRE_FALSE(is_in_bounding_box({25.56, 90.22}, box));
    REQUIRE_FALSE(is_in_bounding_box({25.52, 90.26}, box));
}

TEST_CASE("Bounding box of no points is all zeros") {
    const BoundingBox box = bounding_box({});
    REQUIRE(box.min_latitude_deg == 0.0);
    REQUIRE(box.max_latitude_deg == 0.0);
    REQUIRE(box.min_longitude_deg == 0.0);
    REQUIRE(box.max_longitude_deg == 0.0);
}

TEST_CASE("Polygon centre averages the vertices") {
    const Coordinate center = polygon_center({{0.0, 0.0}, {0.0, 2.0}, {2.0, 2.0}, {2.0, 0.0}});
    REQUIRE(center.latitude_deg == Approx(1.0));
    REQUIRE(center.longitude_deg == Approx(1.0));

    REQUIRE(polygon_center({}) == Coordinate{});
    REQUIRE(polygon_center({k_tura_center}) == k_tura_center);
}

TEST_CASE("Polygon area uses the planar approximation") {
    REQUIRE(polygon_area_km2(unit_square()) == Approx(111.32 * 111.32));
    REQUIRE(polygon_area_km2({{0.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}}) == Approx(111.32 * 111.32 / 2.0));
    REQUIRE(polygon_area_km2({{0.0, 0.0}, {1.0, 1.0}}) == 0.0);
}
