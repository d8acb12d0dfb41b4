#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: category-tagged, level-filtered log lines shared by every module, and handing
// them to the host's logger when one is installed.
// Should NOT do: rotate files, format structured records, or buffer across threads.
namespace sprocket::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives every line that passes the level filter. Called without the log mutex held, so a sink may
// log. A sink that throws std::exception has the line written to the console instead.
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();

// An empty sink restores the default timestamped stdout/stderr output.
void setLogSink(LogSink sink);

// Accepts level names (case-insensitive, "err" and "warning" too) or digits 0-4.
[[nodiscard]] LogLevel parseLogLevel(std::string_view text, LogLevel fallback);
[[nodiscard]] const char* logLevelName(LogLevel level);

// Sets the level for the lifetime of the object, then puts the previous one back.
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel level);
    ~ScopedLogLevel();

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel m_previous;
};

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string_view m_category;
    std::ostringstream m_stream;
};

} // namespace sprocket::core

#define SPROCKET_LOG_STREAM(level, category) \
    if (!::sprocket::core::shouldLog(level)) {} else ::sprocket::core::LogLine((level), (category)).stream()

#define SPROCKET_LOGE(category) SPROCKET_LOG_STREAM(::sprocket::core::LogLevel::Error, (category))
#define SPROCKET_LOGW(category) SPROCKET_LOG_STREAM(::sprocket::core::LogLevel::Warn, (category))
#define SPROCKET_LOGI(category) SPROCKET_LOG_STREAM(::sprocket::core::LogLevel::Info, (category))
#define SPROCKET_LOGD(category) SPROCKET_LOG_STREAM(::sprocket::core::LogLevel::Debug, (category))
#define SPROCKET_LOGT(category) SPROCKET_LOG_STREAM(::sprocket::core::LogLevel::Trace, (category))
