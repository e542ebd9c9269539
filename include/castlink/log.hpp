#ifndef CASTLINK_LOG_HPP
#define CASTLINK_LOG_HPP

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace castlink
{

namespace log
{

enum class level
{
    trace,
    debug,
    info,
    warn,
    error,
    off
};

using sink_type = std::function<void(level, std::string_view)>;

void set_level(level lvl);

level get_level();

// Parses "trace", "debug", ... Unknown names fall back to the given level.
level parse_level(std::string_view name, level fallback);

// Replaces the default sink which prints to stderr. An empty function restores the default.
void set_sink(sink_type sink);

void write(level lvl, std::string_view message);

inline bool enabled(level lvl)
{
    return lvl != level::off && lvl >= get_level();
}

template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::trace))
        write(level::trace, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::debug))
        write(level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::info))
        write(level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::warn))
        write(level::warn, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::error))
        write(level::error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace log

} // namespace castlink

#endif
