// =============================================================================
// lrf - Logger Module
// =============================================================================
// Asynchronous logging for the lrf library and CLI, built on Quill.
//
// The library never initializes logging on its own: until init() is called
// the LRF_LOG_* macros are no-ops, so embedding applications that do not
// want output get none. The CLI calls init() once from main().
//
// Usage:
//   lrf::log::init({.logFile = "lrf.log", .level = lrf::log::Level::kDebug});
//   LRF_LOG_INFO("Recompressed {} region files", count);
// =============================================================================

#ifndef LRF_COMMON_LOGGER_H
#define LRF_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace lrf::log {

/// @brief Log level, mapped onto Quill's levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger configuration, filled from CLI flags.
struct Config {
    /// @brief Log file path. Empty disables the file sink.
    std::string logFile;

    /// @brief Minimum level that reaches the sinks.
    Level level = Level::kInfo;

    /// @brief Write to the console sink.
    bool enableConsole = true;

    /// @brief Quill logger name.
    std::string loggerName = "lrf";
};

/// @brief Start the Quill backend and create the global logger.
/// @note Idempotent; later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Convenience overload used by tests and small tools.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Global logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace lrf::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Each macro checks for an initialized logger so library code can log
// unconditionally.

#define LRF_LOG_IMPL(quillMacro, fmt, ...)                                   \
    do {                                                                     \
        if (quill::Logger* lrfLogger = ::lrf::log::logger(); lrfLogger) {    \
            quillMacro(lrfLogger, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                    \
    } while (false)

#define LRF_LOG_TRACE(fmt, ...) LRF_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LRF_LOG_DEBUG(fmt, ...) LRF_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LRF_LOG_INFO(fmt, ...) LRF_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LRF_LOG_WARNING(fmt, ...) LRF_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LRF_LOG_ERROR(fmt, ...) LRF_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LRF_LOG_CRITICAL(fmt, ...) LRF_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // LRF_COMMON_LOGGER_H
