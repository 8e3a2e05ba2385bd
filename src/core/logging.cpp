#include "waypoint/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace waypoint::core {

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "Unknown log level",
            config.log_level
        );
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.log_path.empty()) {
            fs::create_directories(config.log_path);
            auto file = (config.log_path / "waypoint.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file,
                static_cast<size_t>(config.log_max_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.log_max_files)
            ));
        }

        auto logger = std::make_shared<spdlog::logger>("waypoint", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlog::set_default_logger(logger);

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    }

    return Result<void, Error>::ok();
}

}  // namespace waypoint::core
