#include "delivery_geofence/logging.hpp"

#include <atomic>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace delivery_geofence {

namespace {
constexpr std::size_t k_rotation_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_rotation_file_count{5};
constexpr char k_logger_name[] = "delivery_geofence";
constexpr char k_log_file_name[] = "delivery_geofence.log";
constexpr char k_console_pattern[] = "[%l] %v";
constexpr char k_escaped_payload_flag{'*'};
/** One JSON object per line; the thread id tells the race workers apart. */
constexpr char k_json_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":"%*"})";

std::once_flag logger_init_flag;
std::shared_ptr<spdlog::logger> process_logger;
std::atomic<bool> logger_ready{false};

/** @brief `%*`: the message payload escaped for a JSON string literal. */
class JsonEscapedPayloadFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string escaped = escape_json_string(std::string_view{msg.payload.data(), msg.payload.size()});
        dest.append(escaped.data(), escaped.data() + escaped.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEscapedPayloadFlag>();
    }
};

spdlog::sink_ptr make_console_sink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern(k_console_pattern);
    return sink;
}

spdlog::sink_ptr make_json_file_sink(const std::filesystem::path& log_directory) {
    std::error_code directory_error;
    std::filesystem::create_directories(log_directory, directory_error);
    if (directory_error) {
        throw std::runtime_error("Unable to create log directory at " + log_directory.string() + ": "
                                 + directory_error.message());
    }
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_directory / k_log_file_name).string(),
        k_rotation_size_bytes,
        k_rotation_file_count
    );
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<JsonEscapedPayloadFlag>(k_escaped_payload_flag).set_pattern(k_json_pattern);
    sink->set_formatter(std::move(formatter));
    return sink;
}

}  // namespace

std::string escape_json_string(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char character : text) {
        switch (character) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(character)));
                } else {
                    escaped += character;
                }
        }
    }
    return escaped;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(logger_init_flag, [&log_directory]() {
        spdlog::sinks_init_list sinks{make_console_sink(), make_json_file_sink(log_directory)};
        auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
        logger->set_level(spdlog::level::info);
        // Timeouts and failures reach disk even if the process dies right after.
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        process_logger = std::move(logger);
        logger_ready.store(true);
    });
    return process_logger;
}

bool is_logger_initialized() noexcept {
    return logger_ready.load();
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!is_logger_initialized()) {
        throw std::runtime_error("Logger not initialized");
    }
    return process_logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level_name) {
    const spdlog::level::level_enum level = spdlog::level::from_str(std::string{level_name});
    // from_str answers "off" for names it does not know.
    if (level == spdlog::level::off && level_name != "off") {
        return std::nullopt;
    }
    return level;
}

void set_log_level(const std::string& level_name) {
    if (!is_logger_initialized()) {
        return;
    }
    if (const auto level = parse_log_level(level_name); level.has_value()) {
        process_logger->set_level(level.value());
        return;
    }
    process_logger->warn("Unknown log level {}; defaulting to info", level_name);
    process_logger->set_level(spdlog::level::info);
}

}  // namespace delivery_geofence
