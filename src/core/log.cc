#include "core/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace sprocket::core {
namespace {

constexpr const char* kLogLevelEnvVar = "SPROCKET_LOG_LEVEL";

std::atomic<LogLevel> g_logLevel{LogLevel::Info};
std::once_flag g_envInitOnce;
std::mutex g_logMutex;
LogSink g_logSink;

std::string makeTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    const auto ms = static_cast<int>(epochMs.count() % 1000);
    const std::time_t timeValue = std::chrono::system_clock::to_time_t(now);

    std::tm localTime{};
#if defined(_WIN32)
    localtime_s(&localTime, &timeValue);
#else
    localtime_r(&timeValue, &localTime);
#endif

    char buffer[32]{};
    std::snprintf(
        buffer,
        sizeof(buffer),
        "%02d:%02d:%02d.%03d",
        localTime.tm_hour,
        localTime.tm_min,
        localTime.tm_sec,
        ms);
    return std::string(buffer);
}

void writeToConsole(LogLevel level, std::string_view category, std::string_view message) {
    std::ostream& out = (level == LogLevel::Error || level == LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << makeTimestamp() << "][sprocket";
    if (!category.empty()) {
        out << "/" << category;
    }
    out << "]";
    if (level != LogLevel::Info) {
        out << "[" << logLevelName(level) << "]";
    }
    out << " " << message << "\n";
}

// The sink runs on a copy taken under the mutex, with the mutex released, so it may log or swap the
// sink itself. A throwing sink loses its line to the console instead of unwinding out of ~LogLine.
void dispatchLine(LogLevel level, std::string_view category, std::string_view message) {
    std::unique_lock<std::mutex> lock(g_logMutex);
    if (!g_logSink) {
        writeToConsole(level, category, message);
        return;
    }
    const LogSink sink = g_logSink;
    lock.unlock();

    try {
        sink(level, category, message);
    } catch (const std::exception& e) {
        lock.lock();
        writeToConsole(LogLevel::Error, "log", std::string("log sink threw: ") + e.what());
        writeToConsole(level, category, message);
    }
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](const unsigned char a, const unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::string readEnvironment(const char* name) {
#if defined(_WIN32)
    std::size_t requiredLength = 0;
    char* envBuffer = nullptr;
    if (_dupenv_s(&envBuffer, &requiredLength, name) != 0 || envBuffer == nullptr) {
        return std::string();
    }
    std::string value(envBuffer);
    std::free(envBuffer);
    return value;
#else
    const char* envValue = std::getenv(name);
    return envValue == nullptr ? std::string() : std::string(envValue);
#endif
}

} // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "info";
}

LogLevel parseLogLevel(std::string_view text, LogLevel fallback) {
    if (equalsIgnoreCase(text, "error") || equalsIgnoreCase(text, "err") || text == "0") {
        return LogLevel::Error;
    }
    if (equalsIgnoreCase(text, "warn") || equalsIgnoreCase(text, "warning") || text == "1") {
        return LogLevel::Warn;
    }
    if (equalsIgnoreCase(text, "info") || text == "2") {
        return LogLevel::Info;
    }
    if (equalsIgnoreCase(text, "debug") || text == "3") {
        return LogLevel::Debug;
    }
    if (equalsIgnoreCase(text, "trace") || text == "4") {
        return LogLevel::Trace;
    }
    return fallback;
}

void setLogLevel(LogLevel level) {
    // The environment is read at most once; reading it now keeps it from overriding `level` later.
    initializeLogLevelFromEnvironment();
    g_logLevel.store(level);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return g_logLevel.load();
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    std::call_once(g_envInitOnce, []() {
        const std::string envValue = readEnvironment(kLogLevelEnvVar);
        if (envValue.empty()) {
            return;
        }
        const LogLevel parsed = parseLogLevel(envValue, LogLevel::Info);
        g_logLevel.store(parsed);
        // Only an unknown value depends on the fallback.
        if (parseLogLevel(envValue, LogLevel::Trace) != parsed) {
            dispatchLine(LogLevel::Warn, "log", std::string("unrecognized ") + kLogLevelEnvVar + " '" + envValue + "', using info");
        }
    });
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logSink = std::move(sink);
}

ScopedLogLevel::ScopedLogLevel(LogLevel level) : m_previous(logLevel()) {
    setLogLevel(level);
}

ScopedLogLevel::~ScopedLogLevel() {
    setLogLevel(m_previous);
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    std::string line = m_stream.str();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    dispatchLine(m_level, m_category, line);
}

std::ostream& LogLine::stream() {
    return m_stream;
}

} // namespace sprocket::core
