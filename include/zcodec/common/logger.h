// =============================================================================
// zcodec - Logger Module
// =============================================================================
// Process-wide Quill logger.
//
// Library code emits trace/debug records only: partial decoder chains, block
// selection, store round trips. The ZCODEC_LOG_* macros check for an installed
// logger first, so a program that embeds zcodec and never calls init() pays
// for neither formatting nor the backend thread.
//
// The command-line tool owns initialization through log::Session and maps its
// -v/-q flags through levelForVerbosity().
// =============================================================================

#ifndef ZCODEC_COMMON_LOGGER_H
#define ZCODEC_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace zcodec::log {

/// @brief Severity, ordered from most to least verbose.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Sink selection and threshold for init().
struct Config {
    /// @brief Minimum severity that reaches any sink.
    Level level = Level::kInfo;

    /// @brief Write records to the console.
    bool console = true;

    /// @brief Additional log file; empty for none.
    std::string logFile;

    /// @brief Start the log file empty instead of appending to it.
    bool truncateLogFile = false;

    /// @brief Name under which the Quill logger is registered.
    std::string loggerName = "zcodec";
};

/// @brief Start the Quill backend and install the process logger.
/// @note A second call before shutdown() is ignored. When the configuration
///       names no sink at all nothing is installed and logging stays off.
void init(const Config& config);

/// @brief Installed logger, or nullptr when logging is off.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush records still queued for the backend.
void flush();

/// @brief Flush and stop the backend. Safe to call when never initialized.
void shutdown();

/// @brief RAII owner of the process logger: init() on construction,
///        shutdown() on destruction.
class Session {
public:
    explicit Session(const Config& config) { init(config); }
    ~Session() { shutdown(); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

/// @brief Threshold for the CLI flags: -q keeps errors only, each -v steps
///        one level below info.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Parse a level name ("trace" .. "critical", plus "warn" and
///        "fatal"), ignoring case.
[[nodiscard]] std::optional<Level> parseLevel(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelName(Level level) noexcept;

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace zcodec::log

#define ZCODEC_LOG_IMPL_(macro, fmt, ...)                                       \
    do {                                                                        \
        if (quill::Logger* zcodecLogger_ = zcodec::log::logger()) {             \
            macro(zcodecLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);               \
        }                                                                       \
    } while (0)

#define ZCODEC_LOG_TRACE(fmt, ...) ZCODEC_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ZCODEC_LOG_DEBUG(fmt, ...) ZCODEC_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ZCODEC_LOG_INFO(fmt, ...) ZCODEC_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ZCODEC_LOG_WARNING(fmt, ...) ZCODEC_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ZCODEC_LOG_ERROR(fmt, ...) ZCODEC_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ZCODEC_LOG_CRITICAL(fmt, ...) \
    ZCODEC_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ZCODEC_COMMON_LOGGER_H
