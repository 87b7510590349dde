#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace dcmx::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex logger_mutex;

    spdlog::level::level_enum parse_level(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }
}

void Logger::init(const std::string& level, bool log_to_file) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "dcmx.log",
            1024 * 1024 * 10,  // 10MB
            3                   // 3 rotating files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("dcmx", sinks.begin(), sinks.end());
    logger_->set_level(parse_level(level));

    // Flush on error or higher
    logger_->flush_on(spdlog::level::err);

    spdlog::set_default_logger(logger_);
}

void Logger::set_level(const std::string& level) {
    get()->set_level(parse_level(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (logger_) {
            return logger_;
        }
    }
    init();
    return logger_;
}

} // namespace dcmx::utils
