#include "core/Config.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>

namespace HD {
namespace {

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_timeout_ms(char const* value) -> std::optional<std::chrono::milliseconds> {
    if (value == nullptr) {
        return std::nullopt;
    }
    auto text = trim(value);
    std::int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || parsed <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{parsed};
}

} // namespace

auto ToLower(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

auto ParseTruthy(char const* value, bool fallback) -> bool {
    if (value == nullptr) {
        return fallback;
    }
    auto text = trim(value);
    if (text.empty()) {
        return true;
    }
    auto normalized = ToLower(text);
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto SplitTagList(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tags;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item  = trim(text.substr(0, comma));
        if (!item.empty()) {
            tags.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

auto LoadDispatchConfig() -> DispatchConfig {
    DispatchConfig config;
    if (auto timeout = parse_timeout_ms(std::getenv(kSyncTimeoutEnv))) {
        config.syncTimeout = *timeout;
    }
    return config;
}

auto LoadLoggingConfig() -> LoggingConfig {
    LoggingConfig config;
    if (char const* flag = std::getenv("HOSTDISPATCH_LOG_ENABLED")) {
        config.enabled = ParseTruthy(flag, true);
    } else if (char const* shortFlag = std::getenv("HOSTDISPATCH_LOG")) {
        config.enabled = ParseTruthy(shortFlag, true);
    }
    config.clearDefaultSkips = ParseTruthy(std::getenv("HOSTDISPATCH_LOG_CLEAR_DEFAULT_SKIPS"), false);
    if (char const* enable = std::getenv("HOSTDISPATCH_LOG_ENABLE_TAGS")) {
        config.enableTags = SplitTagList(enable);
    }
    if (char const* skip = std::getenv("HOSTDISPATCH_LOG_SKIP_TAGS")) {
        config.skipTags = SplitTagList(skip);
    }
    return config;
}

auto ReadBackendOverride(std::string const& envName) -> std::optional<std::string> {
    char const* value = std::getenv(envName.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    auto text = trim(value);
    if (text.empty()) {
        return std::nullopt;
    }
    return ToLower(text);
}

} // namespace HD
