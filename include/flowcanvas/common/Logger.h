#pragma once

#include "flowcanvas/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace flowcanvas {

/**
 * @brief Static logging facade used by every flowcanvas module
 *
 * Lines go to the installed backend (a console SpdlogBackend unless the
 * application installs its own). With capture enabled they are also kept
 * in a bounded in-memory buffer so tests and hosts can inspect what the
 * engine reported, e.g. skipped events or persistence failures.
 *
 * @code
 * flowcanvas::Logger::enableCapture(true);
 * LOG_WARN("skipping malformed event at index {}", index);
 * auto warnings = flowcanvas::Logger::getCapturedLogs("malformed", 0, LogLevel::Warn);
 * @endcode
 */
class Logger {
public:
    /// Replace the backend; nullptr reverts to the default on next use
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the console backend if none is set
    static void initialize();

    /// Install a console plus file backend (logDir/flowcanvas.log) if none is set
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Capture =====

    /// Capture is independent of the backend level: every line is kept
    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /// Oldest lines are dropped once the buffer holds this many
    static void setCaptureCapacity(size_t capacity);

    /**
     * @brief Captured lines, formatted "[level] Function() - message"
     * @param pattern Substring filter (empty = all)
     * @param maxLines Keep only the most recent matches (0 = all)
     * @param minLevel Skip lines below this level
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0,
        LogLevel minLevel = LogLevel::Trace);

    static void clearCapturedLogs();

private:
    static void write(LogLevel level, const std::string& message, const std::source_location& loc);
    static ILoggerBackend& backend();
    static std::string callerName(const std::source_location& loc);
};

}  // namespace flowcanvas

// Logging macros, formatted with fmt
#define LOG_TRACE(...) flowcanvas::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) flowcanvas::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  flowcanvas::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  flowcanvas::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) flowcanvas::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
