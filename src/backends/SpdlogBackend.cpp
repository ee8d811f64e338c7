#include "flowcanvas/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowcanvas {

namespace {

constexpr const char* kLoggerName = "flowcanvas";
constexpr const char* kLogFileName = "flowcanvas.log";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v";

std::optional<LogLevel> environmentLevel() {
    for (const char* var : {"FLOWCANVAS_LOG_LEVEL", "SPDLOG_LEVEL"}) {
        if (const char* value = std::getenv(var)) {
            return SpdlogBackend::parseLevel(value);
        }
    }
    return std::nullopt;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // Replacing a backend re-registers the same logger name
    spdlog::drop(kLoggerName);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    std::vector<spdlog::sink_ptr> sinks{console};

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / kLogFileName).string(), true);
        file->set_pattern(kFilePattern);
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);
    logger_->set_level(convertLevel(environmentLevel().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        const std::source_location& loc) {
    logger_->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                 convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::optional<LogLevel> SpdlogBackend::parseLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") return LogLevel::Warn;
    if (lower == "err") return LogLevel::Error;
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        if (lower == logLevelTag(level)) return level;
    }
    return std::nullopt;
}

}  // namespace flowcanvas
