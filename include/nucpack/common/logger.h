// =============================================================================
// nucpack - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from chunk workers (Quill is inherently thread-safe)
//
// Usage:
//   nucpack::log::init("nucpack.log", nucpack::log::Level::kInfo);
//   NUCPACK_LOG_INFO("Compressed {} chunks", count);
//
// The NUCPACK_LOG_* macros are no-ops until init() has been called, so the
// library can be embedded without configuring logging first.
// =============================================================================

#ifndef NUCPACK_COMMON_LOGGER_H
#define NUCPACK_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/StreamSink.h>

namespace nucpack::log {

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

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Send console output to stderr (keeps stdout free for data).
    bool consoleToStderr = false;

    /// @brief Logger name for identification.
    std::string loggerName = "nucpack";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Subsequent calls are ignored until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert nucpack::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace nucpack::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define NUCPACK_LOG_IMPL(quillMacro, fmt, ...)                                      \
    do {                                                                            \
        if (quill::Logger* nucpackLogger_ = ::nucpack::log::logger()) {             \
            quillMacro(nucpackLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);             \
        }                                                                           \
    } while (false)

/// @brief Log a trace message.
#define NUCPACK_LOG_TRACE(fmt, ...) NUCPACK_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define NUCPACK_LOG_DEBUG(fmt, ...) NUCPACK_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define NUCPACK_LOG_INFO(fmt, ...) NUCPACK_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define NUCPACK_LOG_WARNING(fmt, ...) NUCPACK_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define NUCPACK_LOG_ERROR(fmt, ...) NUCPACK_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define NUCPACK_LOG_CRITICAL(fmt, ...) \
    NUCPACK_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // NUCPACK_COMMON_LOGGER_H
