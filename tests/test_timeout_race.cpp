#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include "delivery_geofence/timeout_race.hpp"

using namespace delivery_geofence;

TEST_CASE("Race returns the operation result when it settles first") {
    const std::optional<int> result = race_with_timeout<int>([](std::stop_token) { return 42; }, Duration{1.0});

    REQUIRE(result.has_value());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Race rethrows the operation's exception") {
    auto failing = [](std::stop_token) -> int {
        throw std::runtime_error("sensor offline");
    };

    REQUIRE_THROWS_WITH(race_with_timeout<int>(failing, Duration{1.0}), "sensor offline");
}

TEST_CASE("Race gives up at the deadline and signals the loser to stop") {
    auto flag_stopped = std::make_shared<std::atomic<bool>>(false);

    const auto started_at = SteadyClock::now();
    const std::optional<int> result = race_with_timeout<int>(
        [flag_stopped](std::stop_token stop_token) {
            std::mutex mutex;
            std::condition_variable_any condition;
            std::unique_lock lock(mutex);
            condition.wait_for(lock, stop_token, std::chrono::seconds(5), [] { return false; });
            flag_stopped->store(stop_token.stop_requested());
            return 7;
        },
        Duration{0.05}
    );
    const Duration elapsed = SteadyClock::now() - started_at;

    REQUIRE_FALSE(result.has_value());
    REQUIRE(elapsed.count() < 2.0);

    const auto deadline = SteadyClock::now() + std::chrono::seconds(2);
    while (!flag_stopped->load() && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(flag_stopped->load());
}

TEST_CASE("Race preserves an empty optional result as a settled answer") {
    const std::optional<std::optional<int>> result = race_with_timeout<std::optional<int>>(
        [](std::stop_token) { return std::optional<int>{}; },
        Duration{1.0}
    );

    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
}
