#pragma once

#include <fmt/color.h>
#include <fmt/core.h>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string_view>
#include <utility>

namespace vigil {

class Log {
    // NOLINTNEXTLINE
    static std::atomic<bool> s_colours_enabled;

    template <typename... Args>
    static void write(fmt::rgb colour, std::string_view level, const char *component,
                      fmt::format_string<Args...> format, Args &&...args) {
        std::scoped_lock lock(s_log_lock);
        if (s_colours_enabled.load(std::memory_order_relaxed)) {
            fmt::print(stdout, fmt::fg(colour), "{} [{}] ", level, component);
        } else {
            fmt::print(stdout, "{} [{}] ", level, component);
        }
        fmt::print(stdout, format, std::forward<Args>(args)...);
        std::fputc('\n', stdout);
    }

public:
    // NOLINTNEXTLINE
    static std::mutex s_log_lock;

    static bool colours_enabled() { return s_colours_enabled.load(std::memory_order_relaxed); }
    static void set_colours_enabled(bool colours_enabled);

    template <typename... Args>
    static void trace(const char *component, fmt::format_string<Args...> format, Args &&...args) {
        write(fmt::rgb(70, 130, 180), "TRACE", component, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(const char *component, fmt::format_string<Args...> format, Args &&...args) {
        write(fmt::rgb(100, 149, 237), "DEBUG", component, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(const char *component, fmt::format_string<Args...> format, Args &&...args) {
        write(fmt::rgb(224, 255, 255), "INFO ", component, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(const char *component, fmt::format_string<Args...> format, Args &&...args) {
        write(fmt::rgb(255, 255, 0), "WARN ", component, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(const char *component, fmt::format_string<Args...> format, Args &&...args) {
        write(fmt::rgb(255, 69, 0), "ERROR", component, format, std::forward<Args>(args)...);
    }
};

} // namespace vigil
