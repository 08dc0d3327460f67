#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace rf::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Defined in Log.cpp. Returns false when the log file cannot be written.
bool append_log_line_to_file(std::string const &line) noexcept;

void set_level(Level level) noexcept;
Level level() noexcept;

// Accepts "debug", "info", "warning"/"warn", "error" (any case). Unknown
// names fall back to Info.
Level level_from_string(std::string_view name) noexcept;

inline bool enabled(char level) noexcept
{
    Level value = Level::Info;
    switch (level)
    {
    case 'D':
        value = Level::Debug;
        break;
    case 'W':
        value = Level::Warn;
        break;
    case 'E':
        value = Level::Error;
        break;
    default:
        break;
    }
    return static_cast<int>(value) >= static_cast<int>(log::level());
}

// RF_ENABLE_LOGGING=1 wins over RF_BUILD_MINIMAL so diagnostics can be
// switched on in stripped builds.
#if defined(RF_ENABLE_LOGGING) && (RF_ENABLE_LOGGING)
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    if (!enabled(level))
    {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string line;
    line.reserve(64 + message.size());
    line.push_back('[');
    line.push_back(level);
    line.push_back(' ');
    line.append(time_buffer);
    line.push_back('.');
    line.append(millis_buf);
    line.append("] ");
    line.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", line.c_str());
        std::fflush(stderr);
    }
    append_log_line_to_file(line);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace rf::log

#if defined(RF_ENABLE_LOGGING) && (RF_ENABLE_LOGGING)
#define RF_LOG_INFO(fmt, ...) rf::log::write_line('I', fmt, ##__VA_ARGS__)
#define RF_LOG_DEBUG(fmt, ...) rf::log::write_line('D', fmt, ##__VA_ARGS__)
#define RF_LOG_WARN(fmt, ...) rf::log::write_line('W', fmt, ##__VA_ARGS__)
#define RF_LOG_ERROR(fmt, ...) rf::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#if defined(RF_BUILD_MINIMAL)
#define RF_LOG_INFO(fmt, ...) (void)0
#define RF_LOG_DEBUG(fmt, ...) (void)0
#define RF_LOG_WARN(fmt, ...) (void)0
#define RF_LOG_ERROR(fmt, ...) (void)0
#else
#define RF_LOG_INFO(fmt, ...) rf::log::write_line('I', fmt, ##__VA_ARGS__)
#define RF_LOG_DEBUG(fmt, ...) rf::log::write_line('D', fmt, ##__VA_ARGS__)
#define RF_LOG_WARN(fmt, ...) rf::log::write_line('W', fmt, ##__VA_ARGS__)
#define RF_LOG_ERROR(fmt, ...) rf::log::write_line('E', fmt, ##__VA_ARGS__)
#endif
#endif
