// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component: colored console output
// plus a rotating JSON-lines file. Initialize once at startup; components
// fetch the handle in their constructors.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace delivery_geofence {

/**
 * @brief Create the shared logger writing into @p log_directory.
 *
 * Only the first call configures sinks; later calls return the same logger.
 * @throws std::runtime_error when the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

[[nodiscard]] bool is_logger_initialized() noexcept;

/** @throws std::runtime_error before initialize_logger has succeeded. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Escape quotes, backslashes and control characters for a JSON string literal. */
[[nodiscard]] std::string escape_json_string(std::string_view text);

/** @brief Map an spdlog level name ("debug", "warn", ...) to its level. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level_name);

/** @brief Apply a level by name; unknown names fall back to info. */
void set_log_level(const std::string& level_name);

}  // namespace delivery_geofence
