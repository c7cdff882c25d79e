#pragma once

/// @file log.hpp
/// @brief Logging utilities for vfsh

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define VFSH_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define VFSH_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define VFSH_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define VFSH_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define VFSH_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace vfsh_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 1024 * 1024;  // 1 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::warn;
};

/// Configure logging system with full options.
/// Console output goes to stderr so it never mixes with shell output.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the filesystem logger
std::shared_ptr<spdlog::logger> vfs_logger();

/// Get the shell logger
std::shared_ptr<spdlog::logger> shell_logger();

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
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace vfsh_core
