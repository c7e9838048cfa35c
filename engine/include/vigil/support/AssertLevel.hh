#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace vigil {

// Ordered from least to most severe. NoAssertions is only ever a threshold.
enum class AssertLevel : std::uint8_t {
    Warning,
    Error,
    NoAssertions,
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(std::string_view level_name);
};

constexpr std::strong_ordering compare(AssertLevel lhs, AssertLevel rhs) {
    return static_cast<std::uint8_t>(lhs) <=> static_cast<std::uint8_t>(rhs);
}

constexpr AssertLevel parse_assert_level(std::optional<std::string_view> name) {
    if (!name || name->empty()) {
        return AssertLevel::NoAssertions;
    }
    if (*name == "Warning") {
        return AssertLevel::Warning;
    }
    if (*name == "Error") {
        return AssertLevel::Error;
    }
    if (*name == "NoAssertions") {
        return AssertLevel::NoAssertions;
    }
    throw ConfigurationError(*name);
}

constexpr bool is_assert_active(AssertLevel site_level, AssertLevel threshold) {
    if (site_level == AssertLevel::NoAssertions) {
        throw std::invalid_argument("NoAssertions cannot be used as the level of an assertion");
    }
    return compare(site_level, threshold) >= 0;
}

template <AssertLevel Level>
consteval AssertLevel site_level() {
    static_assert(Level != AssertLevel::NoAssertions, "NoAssertions cannot be used as the level of an assertion");
    return Level;
}

const char *assert_level_name(AssertLevel level);

// Build-wide configuration. Both values have internal linkage so that translation units compiled with different
// settings can share a binary.
// Inline or template functions defined in headers that use VIGIL_ASSERT must still see one configuration in every
// translation unit that includes them, otherwise their definitions differ and the program breaks the ODR.
#ifdef VIGIL_ASSERT_LEVEL
constexpr AssertLevel k_assert_threshold = parse_assert_level(std::string_view(VIGIL_ASSERT_LEVEL));
#else
constexpr AssertLevel k_assert_threshold = parse_assert_level(std::nullopt);
#endif

#ifdef VIGIL_ASSERT_QUIT
constexpr bool k_assert_quit = true;
#else
constexpr bool k_assert_quit = false;
#endif

} // namespace vigil

template <>
struct fmt::formatter<vigil::AssertLevel> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(vigil::AssertLevel level, FormatContext &ctx) const {
        return fmt::formatter<fmt::string_view>::format(vigil::assert_level_name(level), ctx);
    }
};
