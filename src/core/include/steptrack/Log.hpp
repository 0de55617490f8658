#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

/**
 * @file Log.hpp
 * @brief Leveled stderr logging shared by the library and the demo app.
 *
 * @details
 * Verbosity defaults to ``Info``. When the caller leaves the level at ``Info``, the
 * ``STEPTRACK_LOG`` environment variable (``quiet|error|warn|info|debug``) may override it.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   steptrack::logx::init({steptrack::logx::Level::Info, true});
 *   LOGI("loaded %s\n", path.c_str());
 * @endrst
 */

namespace steptrack::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // default verbosity (overridden by STEPTRACK_LOG if level==Info)
    bool color = false;        // ANSI-colored tags, only honored on a TTY
};

inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_color{false};

inline Level level_from_string(std::string s, Level fallback = Level::Info)
{
    for (auto& c : s)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug")
        return Level::Debug;
    return fallback;
}

inline Level level_from_env()
{
    const char* v = std::getenv("STEPTRACK_LOG");
    if (!v)
        return Level::Info;
    return level_from_string(v);
}

inline void init(const Config& cfg = {})
{
    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_color.store(cfg.color && ::isatty(::fileno(stderr)));
}

inline Level level()
{
    return g_level.load();
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline const char* level_color(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "\033[31m";
    case Level::Warn:
        return "\033[33m";
    case Level::Info:
        return "\033[36m";
    case Level::Debug:
        return "\033[34m";
    default:
        return "";
    }
}

inline bool gate(Level L)
{
    return L > g_level.load(); // filtered by level
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    if (g_color.load())
        std::fprintf(stderr, "%s%s\033[0m", level_color(L), level_tag(L));
    else
        std::fputs(level_tag(L), stderr);
    std::vfprintf(stderr, fmt, ap);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

// Convenience
#define LOGD(...) ::steptrack::logx::print(::steptrack::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::steptrack::logx::print(::steptrack::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::steptrack::logx::print(::steptrack::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::steptrack::logx::print(::steptrack::logx::Level::Error, __VA_ARGS__)

} // namespace steptrack::logx
