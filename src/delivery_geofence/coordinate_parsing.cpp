#include "delivery_geofence/coordinate_parsing.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>

#include <fmt/format.h>

namespace delivery_geofence {

namespace {

double parse_component(std::string_view component, std::string_view tuple) {
    double value{};
    const char* first = component.data();
    const char* last = component.data() + component.size();
    if (!component.empty() && *first == '+') {
        ++first;
    }
    const auto [end, error] = std::from_chars(first, last, value);
    if (error != std::errc{} || end != last || first == last) {
        throw std::invalid_argument(fmt::format("Invalid KML coordinates format: '{}' in tuple '{}'", component, tuple));
    }
    return value;
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t position = text.find(separator, start);
        if (position == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, position - start));
        start = position + 1;
    }
    return parts;
}

}  // namespace

std::vector<Coordinate> parse_kml_coordinates(std::string_view kml_coordinates) {
    std::vector<Coordinate> coordinates;

    std::size_t cursor = 0;
    while (cursor < kml_coordinates.size()) {
        while (cursor < kml_coordinates.size() && std::isspace(static_cast<unsigned char>(kml_coordinates[cursor])) != 0) {
            ++cursor;
        }
        const std::size_t tuple_start = cursor;
        while (cursor < kml_coordinates.size() && std::isspace(static_cast<unsigned char>(kml_coordinates[cursor])) == 0) {
            ++cursor;
        }
        if (cursor == tuple_start) {
            break;
        }

        const std::string_view tuple = kml_coordinates.substr(tuple_start, cursor - tuple_start);
        const std::vector<std::string_view> components = split(tuple, ',');
        if (components.size() < 2) {
            continue;
        }
        const double longitude = parse_component(components[0], tuple);
        const double latitude = parse_component(components[1], tuple);
        coordinates.push_back(Coordinate{latitude, longitude});
    }

    return coordinates;
}

}  // namespace delivery_geofence
