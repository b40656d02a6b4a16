// Prism Shader Toolkit Core
// logger.hpp - Category-based logging over spdlog

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace prism::core {

class Config;

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name);

// Logger configuration
struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;         // Empty = console only
    std::string log_filename = "prism.log";
    size_t max_file_size = 5 * 1024 * 1024;      // 5 MB
    size_t max_files = 3;                         // Rotating backup count
    bool include_timestamps = true;

    // console_level from [logging] level; unknown names keep the default
    [[nodiscard]] static LoggerConfig from_config(const Config& config);
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Category-based level control
    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Global level (default for unconfigured categories)
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;  // Static-only class

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

// Pre-defined log categories for consistency
namespace log_category {
    inline constexpr const char* SHADER = "shader";
    inline constexpr const char* PREPROCESSOR = "preprocessor";
    inline constexpr const char* REGISTRY = "registry";
    inline constexpr const char* BACKEND = "backend";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* IO = "io";
}  // namespace log_category

}  // namespace prism::core

// Convenience logging macros - level is checked before formatting
#define PRISM_LOG_TRACE(category, ...) \
    ::prism::core::Logger::trace(category, __VA_ARGS__)

#define PRISM_LOG_DEBUG(category, ...) \
    ::prism::core::Logger::debug(category, __VA_ARGS__)

#define PRISM_LOG_INFO(category, ...) \
    ::prism::core::Logger::info(category, __VA_ARGS__)

#define PRISM_LOG_WARN(category, ...) \
    ::prism::core::Logger::warn(category, __VA_ARGS__)

#define PRISM_LOG_ERROR(category, ...) \
    ::prism::core::Logger::error(category, __VA_ARGS__)

#define PRISM_LOG_CRITICAL(category, ...) \
    ::prism::core::Logger::critical(category, __VA_ARGS__)
