#pragma once

#include "flowcanvas/common/ILoggerBackend.h"
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace flowcanvas {

/// Default backend: colored console sink, plus logDir/flowcanvas.log when
/// file output is requested. FLOWCANVAS_LOG_LEVEL (or SPDLOG_LEVEL)
/// overrides the initial info level.
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    static spdlog::level::level_enum convertLevel(LogLevel level);

    /// Parse a level tag ("warn", "warning", "err", ...), case-insensitive
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flowcanvas
