#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace attn {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                       size_t max_file_size, size_t max_files,
                       bool console_output, bool file_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (file_output && !log_file_path.empty()) {
            // Create logs directory if it doesn't exist
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        // Sinks pass everything; set_level() filters at the logger
        logger_ = std::make_shared<spdlog::logger>("attn", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        // Set flush policy
        logger_->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        Logger::info("Logger initialized");
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

LogLevel Logger::parse_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
    Logger::debug("TIMER | Operation: {} | Duration: {} us", operation_name_, duration.count());
}

} // namespace utils
} // namespace attn
