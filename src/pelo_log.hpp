// =============================================================================
// PeloBridge - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: PLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>
#include <functional>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#endif

namespace pelo::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline bool g_log_to_console = true;

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

// "trace", "debug", "info", "warn", "error", "fatal" (anything else -> Info)
inline Level parseLevel(const std::string& s) {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline void setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_to_console = enabled;
}

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one file per run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long currentThreadId() {
#ifdef _WIN32
    return static_cast<unsigned long>(GetCurrentThreadId());
#else
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
#endif
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = currentThreadId();
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_to_console) {
        fprintf(stderr, "%s [%s] [%s] (T%lu) %s\n", time_str, levelStr(level), tag, tid, msg);
    }
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%lu) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace pelo::log

#define PLOG_TRACE(tag, fmt, ...) pelo::log::write(pelo::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define PLOG_DEBUG(tag, fmt, ...) pelo::log::write(pelo::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define PLOG_INFO(tag, fmt, ...)  pelo::log::write(pelo::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define PLOG_WARN(tag, fmt, ...)  pelo::log::write(pelo::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define PLOG_ERROR(tag, fmt, ...) pelo::log::write(pelo::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define PLOG_FATAL(tag, fmt, ...) pelo::log::write(pelo::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
