#include "flowcanvas/common/Logger.h"
#include "flowcanvas/backends/SpdlogBackend.h"

#include <deque>
#include <mutex>

namespace flowcanvas {

namespace {

struct CapturedLine {
    LogLevel level;
    std::string text;
};

struct LoggerState {
    std::mutex backendMutex;
    std::unique_ptr<ILoggerBackend> backend;

    std::mutex captureMutex;
    bool captureEnabled = false;
    size_t captureCapacity = 10000;
    std::deque<CapturedLine> captured;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(state().backendMutex);
    state().backend = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(state().backendMutex);
    if (!state().backend) {
        state().backend = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(state().backendMutex);
    if (!state().backend) {
        state().backend = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

ILoggerBackend& Logger::backend() {
    initialize();
    return *state().backend;
}

void Logger::setLevel(LogLevel level) {
    backend().setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    backend().flush();
}

void Logger::write(LogLevel level, const std::string& message, const std::source_location& loc) {
    std::string line = callerName(loc) + "() - " + message;
    backend().log(level, line, loc);

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.captureMutex);
    if (!s.captureEnabled) {
        return;
    }
    s.captured.push_back({level, std::string("[") + logLevelTag(level) + "] " + line});
    while (s.captured.size() > s.captureCapacity) {
        s.captured.pop_front();
    }
}

// ===== Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    state().captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    return state().captureEnabled;
}

void Logger::setCaptureCapacity(size_t capacity) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.captureMutex);
    s.captureCapacity = capacity;
    while (s.captured.size() > s.captureCapacity) {
        s.captured.pop_front();
    }
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines,
                                                 LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(state().captureMutex);

    std::vector<std::string> result;
    for (const auto& entry : state().captured) {
        if (entry.level < minLevel) continue;
        if (!pattern.empty() && entry.text.find(pattern) == std::string::npos) continue;
        result.push_back(entry.text);
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(state().captureMutex);
    state().captured.clear();
}

// "flowcanvas::EventBatcher::FlushResult flowcanvas::EventBatcher::flush(TimePoint)"
// becomes "EventBatcher::flush"
std::string Logger::callerName(const std::source_location& loc) {
    const std::string signature = loc.function_name();

    int depth = 0;
    size_t nameStart = 0;
    size_t nameEnd = std::string::npos;
    for (size_t i = 0; i < signature.size(); ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c == ' ') nameStart = i + 1;
        else if (depth == 0 && c == '(') {
            nameEnd = i;
            break;
        }
    }
    if (nameEnd == std::string::npos || nameEnd <= nameStart) {
        return "Unknown";
    }

    std::string name;
    depth = 0;
    for (size_t i = nameStart; i < nameEnd; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c != '*' && c != '&') name += c;
    }

    const std::string prefix = "flowcanvas::";
    if (name.rfind(prefix, 0) == 0) {
        name.erase(0, prefix.size());
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace flowcanvas
