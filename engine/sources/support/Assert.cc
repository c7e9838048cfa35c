#include <vigil/support/Assert.hh>

#include <vigil/support/AssertLevel.hh>
#include <vigil/support/Log.hh>

#include <fmt/core.h>

#include <atomic>
#include <string>
#include <string_view>

namespace vigil {
namespace {

class LogSink final : public AssertSink {
public:
    void emit(std::string_view text, const AssertSite &site) override {
        Log::warn("assert", "{}: {}", format_assertion_location(site.file, site.line), text);
    }
};

// NOLINTNEXTLINE
LogSink s_log_sink;
// NOLINTNEXTLINE
std::atomic<AssertSink *> s_sink{nullptr};
// NOLINTNEXTLINE
std::atomic<StopHook *> s_stop_hook{nullptr};

AssertSink &current_sink() {
    auto *sink = s_sink.load(std::memory_order_acquire);
    return sink != nullptr ? *sink : s_log_sink;
}

} // namespace

AssertionFailure::AssertionFailure(const AssertSite &site, std::string_view message)
    : std::runtime_error(format_assertion_message(site.expression, message)), m_expression(site.expression),
      m_file(site.file), m_line(site.line) {}

std::string AssertionFailure::located_message() const {
    return fmt::format("{}: {}", format_assertion_location(m_file, m_line), what());
}

void set_assert_sink(AssertSink *sink) {
    s_sink.store(sink, std::memory_order_release);
}

void set_assert_stop_hook(StopHook *hook) {
    s_stop_hook.store(hook, std::memory_order_release);
}

std::string format_assertion_message(std::string_view expression, std::string_view message) {
    std::string text("Failed assertion:");
    if (!message.empty()) {
        text += fmt::format("\n\tMessage: {}", message);
    }
    text += fmt::format("\n\tExpression: ({})", expression);
    return text;
}

std::string format_assertion_location(const char *file, unsigned int line) {
    return fmt::format("{}:{}", file, line);
}

void log_assert_config(AssertLevel threshold, bool stop_on_failure) {
    if (threshold == AssertLevel::NoAssertions) {
        Log::info("assert", "Assertions disabled");
        return;
    }
    Log::info("assert", "Assertion threshold {}, stop on failure {}", threshold, stop_on_failure);
}

void report_warning(const AssertSite &site, std::string_view message) {
    current_sink().emit(format_assertion_message(site.expression, message), site);
}

void raise_error(const AssertSite &site, std::string_view message) {
    if (site.stop_on_failure) {
        if (auto *hook = s_stop_hook.load(std::memory_order_acquire)) {
            hook->request_stop();
        }
    }
    throw AssertionFailure(site, message);
}

} // namespace vigil
