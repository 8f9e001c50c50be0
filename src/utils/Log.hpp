#pragma once

#include <chrono>
#include <cstdio>
#include <exception>
#include <ctime>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace folio::log
{

enum class Level : int
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Non-templated helpers (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);
void set_log_file(std::filesystem::path path);
void set_threshold(Level level) noexcept;
Level threshold() noexcept;

inline bool enabled(Level level) noexcept
{
    return static_cast<int>(level) >= static_cast<int>(threshold());
}

inline char level_tag(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return 'D';
    case Level::Info:
        return 'I';
    case Level::Warn:
        return 'W';
    case Level::Error:
        return 'E';
    }
    return '?';
}

// Logging is compiled in unless FOLIO_BUILD_MINIMAL is set. Defining
// FOLIO_ENABLE_LOGGING=1 keeps it even in minimal builds.
#if (defined(FOLIO_ENABLE_LOGGING) && (FOLIO_ENABLE_LOGGING)) ||                \
    !defined(FOLIO_BUILD_MINIMAL)
template <typename... Args>
inline void write_line(Level level, std::string_view fmt, Args &&...args)
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
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level_tag(level));
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &)
    {
        // stderr already carries the line
    }
}
#else
template <typename... Args>
inline void write_line(Level, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace folio::log

#define FOLIO_LOG_DEBUG(fmt, ...)                                              \
    folio::log::write_line(folio::log::Level::Debug, fmt, ##__VA_ARGS__)
#define FOLIO_LOG_INFO(fmt, ...)                                               \
    folio::log::write_line(folio::log::Level::Info, fmt, ##__VA_ARGS__)
#define FOLIO_LOG_WARN(fmt, ...)                                               \
    folio::log::write_line(folio::log::Level::Warn, fmt, ##__VA_ARGS__)
#define FOLIO_LOG_ERROR(fmt, ...)                                              \
    folio::log::write_line(folio::log::Level::Error, fmt, ##__VA_ARGS__)
