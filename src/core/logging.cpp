#include "retrace/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace retrace::core {

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
            fs::path log_file = config.log_path;
            if (fs::is_directory(log_file) || !log_file.has_extension()) {
                fs::create_directories(log_file);
                log_file /= "retrace.log";
            } else if (log_file.has_parent_path()) {
                fs::create_directories(log_file.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string()));
        }

        auto logger = std::make_shared<spdlog::logger>("retrace", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlog::set_default_logger(logger);

        return Result<void, Error>::ok();

    } catch (const spdlog::spdlog_ex& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            config.log_path.string()
        );
    }
}

}  // namespace retrace::core
