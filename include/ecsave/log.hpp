#pragma once
#include "config.hpp"
#include "entity.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace ecsave::log {

enum class Level { Trace, Debug, Info, Warn, Error, Off };

namespace detail {

inline Level& threshold() {
    static Level level = Level::ECSAVE_LOG_LEVEL;
    return level;
}

inline std::mutex& lock() {
    static std::mutex mutex;
    return mutex;
}

inline const char* label(Level level) {
    switch (level) {
    case Level::Trace:
        return "TRACE";
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO ";
    case Level::Warn:
        return "WARN ";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "";
}

} // namespace detail

inline void set_level(Level level) { detail::threshold() = level; }

inline Level level() { return detail::threshold(); }

inline bool enabled(Level level) { return level != Level::Off && level >= detail::threshold(); }

/**
 * @brief Writes one line `LEVEL [component] message` to stderr if `level` passes the threshold.
 */
template <typename... Args>
void write(Level level, const char* component, fmt::format_string<Args...> format,
           Args&&... args) {
    if (!enabled(level))
        return;
    std::string message = fmt::format(format, std::forward<Args>(args)...);
    std::scoped_lock guard(detail::lock());
    fmt::print(stderr, "{} [{}] {}\n", detail::label(level), component, message);
}

template <typename... Args>
void trace(const char* component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Trace, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(const char* component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(const char* component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(const char* component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(const char* component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, component, format, std::forward<Args>(args)...);
}

} // namespace ecsave::log

/**
 * @brief Formats an entity as `index:generation`, or `wire#ordinal` for a serialized reference.
 */
template <>
struct fmt::formatter<ecsave::Entity> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const ecsave::Entity& e, FormatContext& ctx) const {
        if (ecsave::is_wire(e))
            return fmt::format_to(ctx.out(), "wire#{}", e.index);
        return fmt::format_to(ctx.out(), "{}:{}", e.index, e.generation);
    }
};
