// Minimal logging utility (header-only) for the sshutils core.
// Enabled by SSHUTILS_LOG: "1"/"info", "debug", "warn" or "error" select the minimum level.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>
#include <functional>
#include <string>

namespace sshutils {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Optional sink; when set, records go there instead of stderr (tests use it).
using LogSink = std::function<void(LogLevel, const std::string&)>;

inline LogSink& logSinkRef() {
    static LogSink sink;
    return sink;
}

inline void setLogSink(LogSink sink) { logSinkRef() = std::move(sink); }

inline LogLevel logThreshold() {
    if (logSinkRef()) return LogLevel::Debug;
    const char* v = std::getenv("SSHUTILS_LOG");
    if (!v || !*v || *v == '0') return LogLevel::Off;
    if (std::strcmp(v, "debug") == 0) return LogLevel::Debug;
    if (std::strcmp(v, "warn") == 0) return LogLevel::Warn;
    if (std::strcmp(v, "error") == 0) return LogLevel::Error;
    return LogLevel::Info;
}

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(logThreshold());
}

inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "OFF";
    }
}

inline void logf(LogLevel level, const char* fmt, ...) {
    if (!logEnabled(level)) return;
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (logSinkRef()) {
        logSinkRef()(level, buf);
        return;
    }
    std::fprintf(stderr, "[sshutils][%s] %s\n", logLevelName(level), buf);
}

} // namespace sshutils

#define SSHUTILS_LOG_AT(level, fmt, ...) \
    do { \
        if (sshutils::logEnabled(level)) \
            sshutils::logf(level, fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGD(fmt, ...) SSHUTILS_LOG_AT(sshutils::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) SSHUTILS_LOG_AT(sshutils::LogLevel::Info, fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) SSHUTILS_LOG_AT(sshutils::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) SSHUTILS_LOG_AT(sshutils::LogLevel::Error, fmt, ##__VA_ARGS__)
