#pragma once

#include <source_location>
#include <string>

namespace flowcanvas {

/// Severity of a log line, ordered from most to least verbose
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Lower-case tag used in captured lines ("trace", "warn", ...)
inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/// Sink for engine diagnostics
///
/// Implemented by SpdlogBackend; an application embedding the canvas engine
/// can install its own through Logger::setBackend().
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /// Lines below this level are dropped by the backend
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace flowcanvas
