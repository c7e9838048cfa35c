#include "Config.hh"

#include <vigil/support/Log.hh>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

using vigil::Log;

namespace {

std::runtime_error invalid_value(const char *option, const std::string &value) {
    return std::runtime_error(fmt::format("Config option {} has invalid value '{}'", option, value));
}

} // namespace

Config::Config(const char *path) : m_file(path, std::ios::in) {
    if (!m_file) {
        Log::info("sandbox", "Config file {} not found, creating default config", path);
        m_file.open(path, std::ios::out);
        write_default_config();
        m_file.flush();
        m_file.close();
        m_file.open(path, std::ios::in);
    }
    if (!m_file) {
        throw std::runtime_error(fmt::format("Failed to open config file {}", path));
    }
}

void Config::write_default_config() {
    m_file << "frame_count: 120\n";
    m_file << "frame_budget_ms: 16.6\n";
    m_file << "# Frame, counting from 1, on which the object pool is corrupted. 0 to never fail.\n";
    m_file << "fail_frame: 0\n";
}

void Config::parse() {
    std::string line;
    while (std::getline(m_file, line)) {
        // Ignore comments.
        if (line.empty() || line.starts_with('#')) {
            continue;
        }
        const auto colon_position = line.find_first_of(':');
        if (colon_position == std::string::npos) {
            Log::warn("sandbox", "Ignoring malformed config line '{}'", line);
            continue;
        }
        auto key = line.substr(0, colon_position);
        auto val = line.substr(colon_position + 1);
        val.erase(std::remove_if(val.begin(), val.end(),
                                 [](unsigned char ch) {
                                     return std::isspace(ch) != 0;
                                 }),
                  val.end());
        m_options.insert_or_assign(std::move(key), std::move(val));
    }
}

template <>
const std::string &Config::get(const char *option) const {
    return m_options.at(option);
}

template <>
bool Config::get(const char *option) const {
    return m_options.at(option) == "true";
}

template <>
std::uint32_t Config::get(const char *option) const {
    const auto &value = m_options.at(option);
    // stoul wraps negative input around instead of rejecting it.
    if (value.empty() || value[0] == '-') {
        throw invalid_value(option, value);
    }
    std::size_t end = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &end);
    } catch (const std::logic_error &) {
        throw invalid_value(option, value);
    }
    if (end != value.size() || parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw invalid_value(option, value);
    }
    return static_cast<std::uint32_t>(parsed);
}

template <>
float Config::get(const char *option) const {
    const auto &value = m_options.at(option);
    std::size_t end = 0;
    float parsed = 0.0F;
    try {
        parsed = std::stof(value, &end);
    } catch (const std::logic_error &) {
        throw invalid_value(option, value);
    }
    if (end != value.size()) {
        throw invalid_value(option, value);
    }
    return parsed;
}
