// =============================================================================
// seqcov - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console (stderr) and optional file output
//
// Standard output is reserved for the coverage report, so the console sink
// always writes to stderr.
//
// Usage:
//   seqcov::log::init({.logFile = "run.log", .level = seqcov::log::Level::kDebug});
//   SEQCOV_LOG_INFO("Loaded {} samples", count);
//
// The SEQCOV_LOG_* macros are no-ops until init() has been called, so library
// code can log unconditionally (unit tests never initialise the backend).
// =============================================================================

#ifndef SEQCOV_COMMON_LOGGER_H
#define SEQCOV_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace seqcov::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once from main() before any work; later calls are ignored.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace seqcov::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SEQCOV_LOG_IMPL(QUILL_MACRO, fmt, ...)                                   \
    do {                                                                         \
        if (quill::Logger* seqcovLogger_ = seqcov::log::logger()) {              \
            QUILL_MACRO(seqcovLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                        \
    } while (false)

/// @brief Log a trace message.
#define SEQCOV_LOG_TRACE(fmt, ...) SEQCOV_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SEQCOV_LOG_DEBUG(fmt, ...) SEQCOV_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SEQCOV_LOG_INFO(fmt, ...) SEQCOV_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SEQCOV_LOG_WARNING(fmt, ...) SEQCOV_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SEQCOV_LOG_ERROR(fmt, ...) SEQCOV_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SEQCOV_LOG_CRITICAL(fmt, ...) SEQCOV_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SEQCOV_COMMON_LOGGER_H
