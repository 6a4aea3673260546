#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <spdlog/spdlog.h>

namespace attn {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/attn_router.log",
                          LogLevel level = LogLevel::INFO,
                          size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                          size_t max_files = 3,
                          bool console_output = true,
                          bool file_output = true);

    static void shutdown();

    // Template logging functions
    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    // Set log level dynamically
    static void set_level(LogLevel level);

    // Get current log level
    static LogLevel get_level();

    // Check if a log level is enabled
    static bool is_enabled(LogLevel level);

    // "DEBUG", "warn", ... ; unknown names map to INFO
    static LogLevel parse_level(const std::string& level_str);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
    static LogLevel current_level_;
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

// Macros for convenient logging
#define ATTN_LOG_TRACE(...) attn::utils::Logger::trace(__VA_ARGS__)
#define ATTN_LOG_DEBUG(...) attn::utils::Logger::debug(__VA_ARGS__)
#define ATTN_LOG_INFO(...) attn::utils::Logger::info(__VA_ARGS__)
#define ATTN_LOG_WARN(...) attn::utils::Logger::warn(__VA_ARGS__)
#define ATTN_LOG_ERROR(...) attn::utils::Logger::error(__VA_ARGS__)
#define ATTN_LOG_CRITICAL(...) attn::utils::Logger::critical(__VA_ARGS__)

#define ATTN_SCOPED_TIMER(name) attn::utils::ScopedTimer timer(name)

} // namespace utils
} // namespace attn
