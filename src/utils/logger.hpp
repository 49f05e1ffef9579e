#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace swarmbed::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to file in addition to console
     * @param log_path Rotating log file, used when log_to_file is set
     */
    static void init(const std::string& level = "info",
                     bool log_to_file = false,
                     const std::string& log_path = "swarmbed.log");

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace swarmbed::utils

// Convenience macros
#define SWARMBED_LOG_TRACE(...)    swarmbed::utils::Logger::get()->trace(__VA_ARGS__)
#define SWARMBED_LOG_DEBUG(...)    swarmbed::utils::Logger::get()->debug(__VA_ARGS__)
#define SWARMBED_LOG_INFO(...)     swarmbed::utils::Logger::get()->info(__VA_ARGS__)
#define SWARMBED_LOG_WARN(...)     swarmbed::utils::Logger::get()->warn(__VA_ARGS__)
#define SWARMBED_LOG_ERROR(...)    swarmbed::utils::Logger::get()->error(__VA_ARGS__)
#define SWARMBED_LOG_CRITICAL(...) swarmbed::utils::Logger::get()->critical(__VA_ARGS__)
