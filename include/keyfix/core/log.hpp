#pragma once

/// @file log.hpp
/// @brief Logging utilities for keyfix

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define KEYFIX_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define KEYFIX_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define KEYFIX_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define KEYFIX_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace keyfix_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;      ///< keyfix.log is written here when file_enabled
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options. Existing loggers switch to the
/// new sinks, and the default logger behind KEYFIX_LOG_* becomes "keyfix".
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for scene loading and writing
std::shared_ptr<spdlog::logger> scene_logger();

/// Logger for the timing repair engine
std::shared_ptr<spdlog::logger> repair_logger();

/// Logger for configuration handling
std::shared_ptr<spdlog::logger> config_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for timing a processing phase
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "keyfix");
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define KEYFIX_LOG_CONCAT_INNER(a, b) a##b
#define KEYFIX_LOG_CONCAT(a, b) KEYFIX_LOG_CONCAT_INNER(a, b)
#define KEYFIX_LOG_SCOPE(name) ::keyfix_core::LogScope KEYFIX_LOG_CONCAT(_log_scope_, __LINE__)(name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace keyfix_core
