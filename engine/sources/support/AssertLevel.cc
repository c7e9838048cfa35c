#include <vigil/support/AssertLevel.hh>

#include <fmt/core.h>

#include <string_view>

namespace vigil {

ConfigurationError::ConfigurationError(std::string_view level_name)
    : std::runtime_error(fmt::format("Could not parse assertion level '{}' (expected Warning, Error or NoAssertions)",
                                     level_name)) {}

const char *assert_level_name(AssertLevel level) {
    switch (level) {
    case AssertLevel::Warning:
        return "Warning";
    case AssertLevel::Error:
        return "Error";
    case AssertLevel::NoAssertions:
        return "NoAssertions";
    }
    return "Unknown";
}

} // namespace vigil
