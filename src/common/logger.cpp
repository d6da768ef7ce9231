// =============================================================================
// zcodec - Logger Module Implementation
// =============================================================================

#include "zcodec/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace zcodec::log {

namespace {

struct LevelEntry {
    std::string_view name;
    Level level;
    quill::LogLevel quillLevel;
};

// Canonical names first; parseLevel also accepts the aliases after them.
constexpr std::array<LevelEntry, 8> kLevelTable{{
    {"trace", Level::kTrace, quill::LogLevel::TraceL1},
    {"debug", Level::kDebug, quill::LogLevel::Debug},
    {"info", Level::kInfo, quill::LogLevel::Info},
    {"warning", Level::kWarning, quill::LogLevel::Warning},
    {"error", Level::kError, quill::LogLevel::Error},
    {"critical", Level::kCritical, quill::LogLevel::Critical},
    {"warn", Level::kWarning, quill::LogLevel::Warning},
    {"fatal", Level::kCritical, quill::LogLevel::Critical},
}};

const LevelEntry& entryFor(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < 6 ? kLevelTable[index] : kLevelTable[static_cast<std::size_t>(Level::kInfo)];
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::atomic<quill::Logger*> gLogger{nullptr};
bool gBackendRunning = false;  // guarded by gLifecycleMutex
std::mutex gLifecycleMutex;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path, bool truncate) {
    quill::FileSinkConfig sinkConfig;
    sinkConfig.set_open_mode(truncate ? 'w' : 'a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, sinkConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Names
// =============================================================================

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

std::optional<Level> parseLevel(std::string_view name) noexcept {
    const auto it = std::ranges::find_if(
        kLevelTable, [name](const LevelEntry& entry) { return equalsIgnoreCase(entry.name, name); });
    if (it == kLevelTable.end()) {
        return std::nullopt;
    }
    return it->level;
}

std::string_view levelName(Level level) noexcept {
    return entryFor(level).name;
}

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gBackendRunning) {
        return;
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.console) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile, config.truncateLogFile));
    }
    if (sinks.empty()) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});
    gBackendRunning = true;

    quill::Logger* installed =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    installed->set_log_level(toQuillLevel(config.level));
    gLogger.store(installed, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* installed = logger()) {
        installed->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (!gBackendRunning) {
        return;
    }
    flush();
    gLogger.store(nullptr, std::memory_order_release);
    quill::Backend::stop();
    gBackendRunning = false;
}

}  // namespace zcodec::log
