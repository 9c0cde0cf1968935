// === Timeout Race ============================================================
//
// Bounded wait over a blocking operation: the operation runs on a detached
// worker and the caller waits at most `timeout` for it to settle. When the
// timer wins, the worker's stop token is signalled and whatever it produces
// later is dropped together with the shared state.
//
// Operations must own (by value or shared_ptr) everything they touch; the
// worker can outlive the caller's stack frame.

#pragma once

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include "delivery_geofence/types.hpp"

namespace delivery_geofence {

/**
 * @brief Run `operation(std::stop_token)` and wait up to @p timeout for it.
 *
 * @return The operation's result, or std::nullopt when the timeout elapsed
 *         first.
 * @throws Whatever the operation threw, if it settled first with an exception.
 */
template <typename Result, typename Operation>
[[nodiscard]] std::optional<Result> race_with_timeout(Operation operation, Duration timeout) {
    struct RaceState final {
        std::promise<Result> promise;
        std::stop_source stop_source;
    };

    auto state = std::make_shared<RaceState>();
    std::future<Result> future = state->promise.get_future();

    std::thread worker([state, operation = std::move(operation)]() mutable {
        try {
            state->promise.set_value(operation(state->stop_source.get_token()));
        } catch (...) {
            state->promise.set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        state->stop_source.request_stop();
        return std::nullopt;
    }
    return future.get();
}

}  // namespace delivery_geofence
