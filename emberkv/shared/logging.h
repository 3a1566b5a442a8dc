#pragma once
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string_view>

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

inline constexpr std::string_view log_level_names[] = {"debug", "info", "warn", "error"};

// "debug", "info", "warn" or "error", as accepted by --log-level and log_level
inline bool parse_log_level(std::string_view str, log_level& level)
{
    for (uint8_t i = 0; i < 4; ++i)
    {
        if (str == log_level_names[i])
        {
            level = static_cast<log_level>(i);
            return true;
        }
    }
    return false;
}

// Process-wide stderr logger. The event loop and the snapshot thread both
// write through it, one whole line at a time.
struct logger
{
    static inline log_level g_level = log_info;

    static bool enabled(log_level level) { return level >= g_level; }

    static void write(log_level level, std::string_view msg)
    {
        static constexpr const char* tags[] = {"DEBUG", "INFO", "WARN", "ERROR"};

        struct timespec ts{};
        clock_gettime(CLOCK_REALTIME, &ts);
        std::tm tm{};
        localtime_r(&ts.tv_sec, &tm);

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(stderr, "[%02d:%02d:%02d.%03ld] [%s] %.*s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, ts.tv_nsec / 1000000,
            level <= log_error ? tags[level] : "?",
            static_cast<int>(msg.size()), msg.data());
    }
};

// The message expression is only evaluated when the level is enabled
#define EMBERKV_LOG(level, msg) do { if (logger::enabled(level)) logger::write(level, msg); } while (0)

#define LOG_DEBUG(msg) EMBERKV_LOG(log_debug, msg)
#define LOG_INFO(msg)  EMBERKV_LOG(log_info, msg)
#define LOG_WARN(msg)  EMBERKV_LOG(log_warn, msg)
#define LOG_ERROR(msg) EMBERKV_LOG(log_error, msg)
