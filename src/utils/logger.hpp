#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace dcmx::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to dcmx.log in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Change the level of an initialized logger
     */
    static void set_level(const std::string& level);

    /**
     * Get the logger instance (initializes with defaults on first use)
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dcmx::utils

// Convenience macros
#define DCMX_LOG_TRACE(...)    dcmx::utils::Logger::get()->trace(__VA_ARGS__)
#define DCMX_LOG_DEBUG(...)    dcmx::utils::Logger::get()->debug(__VA_ARGS__)
#define DCMX_LOG_INFO(...)     dcmx::utils::Logger::get()->info(__VA_ARGS__)
#define DCMX_LOG_WARN(...)     dcmx::utils::Logger::get()->warn(__VA_ARGS__)
#define DCMX_LOG_ERROR(...)    dcmx::utils::Logger::get()->error(__VA_ARGS__)
#define DCMX_LOG_CRITICAL(...) dcmx::utils::Logger::get()->critical(__VA_ARGS__)
