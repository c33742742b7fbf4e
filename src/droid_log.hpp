// =============================================================================
// DroidMirror - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: DLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>
#include <functional>
#include <optional>
#include <cctype>

namespace droid::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::atomic<bool> g_console{true};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "debug", "WARN", ... -> Level. Unknown names yield nullopt.
inline std::optional<Level> parseLevel(const std::string& name) {
    std::string s;
    for (char c : name) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return std::nullopt;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(); }

// Console output can be muted (tests, interactive prompt redraws)
inline void setConsoleOutput(bool enabled) { g_console = enabled; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "a");
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long currentThreadTag() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = currentThreadTag();
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_console.load(std::memory_order_relaxed)) {
        fprintf(stderr, "%s [%s] [%s] (T%05lu) %s\n", time_str, levelStr(level), tag, tid, msg);
    }
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%05lu) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace droid::log

#define DLOG_TRACE(tag, fmt, ...) droid::log::write(droid::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define DLOG_DEBUG(tag, fmt, ...) droid::log::write(droid::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define DLOG_INFO(tag, fmt, ...)  droid::log::write(droid::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define DLOG_WARN(tag, fmt, ...)  droid::log::write(droid::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define DLOG_ERROR(tag, fmt, ...) droid::log::write(droid::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define DLOG_FATAL(tag, fmt, ...) droid::log::write(droid::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
