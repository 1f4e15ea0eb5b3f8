#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HD {

inline constexpr char const* kBackendOverrideEnv = "HOSTDISPATCH_BACKEND";
inline constexpr char const* kSyncTimeoutEnv     = "HOSTDISPATCH_SYNC_TIMEOUT_MS";

inline constexpr std::chrono::milliseconds kDefaultSyncTimeout{30000};

struct DispatchConfig {
    std::chrono::milliseconds syncTimeout = kDefaultSyncTimeout;
};

struct LoggingConfig {
    bool                     enabled           = true;
    bool                     clearDefaultSkips = false;
    std::vector<std::string> enableTags;
    std::vector<std::string> skipTags;
};

// Unset -> fallback. Empty or anything but 0/false/off/no -> true.
[[nodiscard]] auto ParseTruthy(char const* value, bool fallback) -> bool;

[[nodiscard]] auto SplitTagList(std::string_view text) -> std::vector<std::string>;

[[nodiscard]] auto LoadDispatchConfig() -> DispatchConfig;
[[nodiscard]] auto LoadLoggingConfig() -> LoggingConfig;

// Trimmed, lower-cased value of the override variable; nullopt when unset or blank.
[[nodiscard]] auto ReadBackendOverride(std::string const& envName = kBackendOverrideEnv) -> std::optional<std::string>;

[[nodiscard]] auto ToLower(std::string_view text) -> std::string;

} // namespace HD
