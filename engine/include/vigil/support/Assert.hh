#pragma once

#include <vigil/support/AssertLevel.hh> // IWYU pragma: export

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Checks expr only when LEVEL (Warning or Error) is at or above the build threshold. Otherwise the whole site,
// including the condition and any message arguments, is discarded at compile time.
#define VIGIL_ASSERT(LEVEL, expr, ...)                                                                                 \
    do {                                                                                                               \
        if constexpr (::vigil::is_assert_active(::vigil::site_level<::vigil::AssertLevel::LEVEL>(),                    \
                                                ::vigil::k_assert_threshold)) {                                        \
            if (!static_cast<bool>(expr)) [[unlikely]] {                                                               \
                ::vigil::assertion_failed<::vigil::AssertLevel::LEVEL>(                                                \
                    ::vigil::AssertSite{#expr, __FILE__, __LINE__, ::vigil::k_assert_quit} __VA_OPT__(, ) __VA_ARGS__);\
            }                                                                                                          \
        }                                                                                                              \
    } while (false)

#define VIGIL_ASSERT_NOT_REACHED(LEVEL, ...) VIGIL_ASSERT(LEVEL, false __VA_OPT__(, ) __VA_ARGS__)

namespace vigil {

struct AssertSite {
    const char *expression;
    const char *file;
    unsigned int line;
    bool stop_on_failure;
};

class AssertionFailure : public std::runtime_error {
    const char *m_expression;
    const char *m_file;
    unsigned int m_line;

public:
    AssertionFailure(const AssertSite &site, std::string_view message);

    const char *expression() const { return m_expression; }
    const char *file() const { return m_file; }
    unsigned int line() const { return m_line; }

    std::string located_message() const;
};

class AssertSink {
public:
    AssertSink() = default;
    AssertSink(const AssertSink &) = delete;
    AssertSink(AssertSink &&) = delete;
    virtual ~AssertSink() = default;

    AssertSink &operator=(const AssertSink &) = delete;
    AssertSink &operator=(AssertSink &&) = delete;

    virtual void emit(std::string_view text, const AssertSite &site) = 0;
};

class StopHook {
public:
    StopHook() = default;
    StopHook(const StopHook &) = delete;
    StopHook(StopHook &&) = delete;
    virtual ~StopHook() = default;

    StopHook &operator=(const StopHook &) = delete;
    StopHook &operator=(StopHook &&) = delete;

    // Best-effort. The failure is thrown regardless of whether the host actually stops. Must not throw, since it runs
    // while the assertion failure is being raised.
    virtual void request_stop() noexcept = 0;
};

// Passing nullptr restores the default sink, which writes through Log::warn.
void set_assert_sink(AssertSink *sink);
// Passing nullptr removes the hook.
void set_assert_stop_hook(StopHook *hook);

std::string format_assertion_message(std::string_view expression, std::string_view message);
std::string format_assertion_location(const char *file, unsigned int line);
// Takes the caller's view of the build configuration, which is fixed per translation unit.
void log_assert_config(AssertLevel threshold, bool stop_on_failure);

void report_warning(const AssertSite &site, std::string_view message);
[[noreturn]] void raise_error(const AssertSite &site, std::string_view message);

template <AssertLevel Level>
void dispatch_failure(const AssertSite &site, std::string_view message) {
    if constexpr (Level == AssertLevel::Warning) {
        report_warning(site, message);
    } else {
        raise_error(site, message);
    }
}

template <AssertLevel Level>
void assertion_failed(const AssertSite &site) {
    dispatch_failure<Level>(site, {});
}

template <AssertLevel Level, typename... Args>
void assertion_failed(const AssertSite &site, fmt::format_string<Args...> format, Args &&...args) {
    const auto message = fmt::format(format, std::forward<Args>(args)...);
    dispatch_failure<Level>(site, message);
}

} // namespace vigil
