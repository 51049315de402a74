#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace bluest
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // session milestones, printed unless the threshold is raised above Error
};

inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Info};
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv, std::memory_order_relaxed);
}

inline void set_log_level_by_name(const char *name)
{
    const std::string level = name ? std::string(name) : std::string();
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

// scan worker, listener pool and callers all log; keep one line per call
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level().load(std::memory_order_relaxed))
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    char    msg[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    const size_t m  = std::strlen(msg);
    const bool   nl = (m > 0 && msg[m - 1] == '\n');

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: %s%s", ts, level_name(lv), func ? func : "?", msg,
                 nl ? "" : "\n");
}

#define LOG_DEBUG(...) ::bluest::logf(::bluest::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::bluest::logf(::bluest::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::bluest::logf(::bluest::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::bluest::logf(::bluest::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::bluest::logf(::bluest::Level::System, __func__, __VA_ARGS__)

}  // namespace bluest
