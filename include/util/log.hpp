#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace chunkfarm
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing lifecycle lines
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// CHUNKFARM_LOG_LEVEL value, any case; null or unknown -> info
inline void set_log_level_by_name(const char *name)
{
    std::string level = name ? name : "";
    for (auto &ch : level)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (level == "debug")
        set_log_level(Level::Debug);
    else if (level == "warn" || level == "warning")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one line per call even when the dispatcher and transport threads log together
    char    line[1024];
    int     off = std::snprintf(line, sizeof(line), "%s %s %s: ", ts, level_name(lv),
                                func ? func : "?");
    va_list ap;
    va_start(ap, fmt);
    if (off > 0 && (size_t)off < sizeof(line))
        std::vsnprintf(line + off, sizeof(line) - (size_t)off, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(line);
    if (m == 0 || line[m - 1] != '\n')
        std::fprintf(stderr, "%s\n", line);
    else
        std::fputs(line, stderr);
}

#define LOG_DEBUG(...) ::chunkfarm::logf(::chunkfarm::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::chunkfarm::logf(::chunkfarm::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::chunkfarm::logf(::chunkfarm::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::chunkfarm::logf(::chunkfarm::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::chunkfarm::logf(::chunkfarm::Level::System, __func__, __VA_ARGS__)

}  // namespace chunkfarm
