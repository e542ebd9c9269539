#include "castlink/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace castlink
{

namespace log
{

namespace
{

std::atomic<level> g_level {level::warn};

std::mutex g_sink_mutex;

sink_type g_sink;

std::string_view level_name(level lvl)
{
    switch(lvl)
    {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
        default:
            return "off";
    }
}

} // namespace

void set_level(level lvl)
{
    g_level.store(lvl);
}

level get_level()
{
    return g_level.load();
}

level parse_level(std::string_view name, level fallback)
{
    for(level lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::off})
    {
        if(level_name(lvl) == name)
            return lvl;
    }
    return fallback;
}

void set_sink(sink_type sink)
{
    std::lock_guard<std::mutex> lock {g_sink_mutex};
    g_sink = std::move(sink);
}

void write(level lvl, std::string_view message)
{
    std::lock_guard<std::mutex> lock {g_sink_mutex};
    if(g_sink)
    {
        g_sink(lvl, message);
        return;
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fmt::print(stderr, "[{}.{:03}] [castlink] [{}] {}\n", ms / 1000, ms % 1000, level_name(lvl), message);
}

} // namespace log

} // namespace castlink
