#include <fstream>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"

using namespace delivery_geofence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    delivery_geofence::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("JSON escaping leaves plain text alone") {
    REQUIRE(escape_json_string("Delivery available in Tura Town") == "Delivery available in Tura Town");
    REQUIRE(escape_json_string("").empty());
}

TEST_CASE("JSON escaping handles quotes, backslashes and control characters") {
    REQUIRE(escape_json_string(R"(zone "tura")") == R"(zone \"tura\")");
    REQUIRE(escape_json_string(R"(C:\logs)") == R"(C:\\logs)");
    REQUIRE(escape_json_string("line one\nline two\t!") == R"(line one\nline two\t!)");
    REQUIRE(escape_json_string(std::string{"bell\x07"}) == R"(bell\u0007)");
}

TEST_CASE("Log file lines stay valid JSON when messages carry quotes") {
    auto logger = get_logger();
    logger->warn("Zone source failed: \"backend\" at C:\\zones");
    logger->flush();

    std::ifstream log_file(delivery_geofence::test::test_log_directory() / "delivery_geofence.log");
    REQUIRE(log_file.is_open());

    bool found_line = false;
    std::string line;
    while (std::getline(log_file, line)) {
        if (line.find(R"("msg":"Zone source failed: \"backend\" at C:\\zones"})") != std::string::npos) {
            found_line = true;
        }
    }
    REQUIRE(found_line);
}
