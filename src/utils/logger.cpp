#include "utils/logger.hpp"
#include "cqlgen/config.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace cqlgen {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

std::optional<LogLevel> parse_log_level(std::string_view text) {
    const std::string lower = boost::to_lower_copy(std::string(text));

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    return std::nullopt;
}

void Logger::init(const std::string& log_file, LogLevel level) {
#if CQLGEN_ENABLE_LOGGING
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink; stdout carries generated statements
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("cqlgen", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        logger_ = std::make_shared<spdlog::logger>("cqlgen",
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->warn("file logging disabled: {}", ex.what());
    }
#else
    (void)log_file;
    (void)level;
#endif
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

} // namespace cqlgen
