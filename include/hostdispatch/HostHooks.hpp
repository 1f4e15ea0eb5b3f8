#pragma once

#include <string_view>
#include <type_traits>
#include <variant>

namespace HD {

/**
 * Host handshake tables.
 *
 * A host plugin describes its native deferred/blocking primitives by filling
 * one of these structs and installing it with DispatchContext::installHost().
 * Every entry point receives the `host` cookie back as its first argument so
 * plugins can route into their own state without globals.
 *
 * Scheduling entry points return false when the host refuses the request
 * (for example while it is tearing down). Blocking entry points must not
 * return before the callback has run.
 */

using HostCallback      = void (*)(void* data);
// Returns the delay in seconds until the next call; a negative value unregisters.
using HostTimerCallback = double (*)(void* data);
// Returns true to stay registered for the next tick.
using HostTickCallback  = bool (*)(void* data, float deltaSeconds);
using HostThreadQuery   = bool (*)(void* host);

struct MayaHooks {
    void* host = nullptr;
    bool (*executeDeferred)(void* host, HostCallback callback, void* data)               = nullptr;
    bool (*executeInMainThreadWithResult)(void* host, HostCallback callback, void* data) = nullptr;
};

struct HoudiniHooks {
    void* host = nullptr;
    bool (*evalDeferred)(void* host, HostCallback callback, void* data)     = nullptr;
    bool (*evalInMainThread)(void* host, HostCallback callback, void* data) = nullptr;
};

struct NukeHooks {
    void* host = nullptr;
    bool (*executeInMainThread)(void* host, HostCallback callback, void* data)           = nullptr;
    bool (*executeInMainThreadWithResult)(void* host, HostCallback callback, void* data) = nullptr;
    HostThreadQuery isMainThread                                                         = nullptr; // optional
};

struct BlenderHooks {
    void* host = nullptr;
    bool (*registerTimer)(void* host, HostTimerCallback callback, void* data, double firstInterval) = nullptr;
};

struct MaxHooks {
    void* host = nullptr;
    bool (*singleShot)(void* host, int msec, HostCallback callback, void* data) = nullptr; // optional
    HostThreadQuery isGuiThread                                                  = nullptr; // optional
};

struct UnrealHooks {
    void* host = nullptr;
    bool (*registerSlatePostTickCallback)(void* host, HostTickCallback callback, void* data) = nullptr;
    HostThreadQuery isGameThread                                                             = nullptr; // optional
};

struct QtHooks {
    void* host = nullptr;
    bool (*singleShot)(void* host, int msec, HostCallback callback, void* data) = nullptr;
    HostThreadQuery isGuiThread                                                  = nullptr; // optional
};

enum class HostKind {
    Maya,
    Houdini,
    Nuke,
    Blender,
    Max,
    Unreal,
    Qt
};

using HostHooks = std::variant<MayaHooks, HoudiniHooks, NukeHooks, BlenderHooks, MaxHooks, UnrealHooks, QtHooks>;

template <typename H>
constexpr auto hostKindFor() -> HostKind {
    if constexpr (std::is_same_v<H, MayaHooks>)
        return HostKind::Maya;
    else if constexpr (std::is_same_v<H, HoudiniHooks>)
        return HostKind::Houdini;
    else if constexpr (std::is_same_v<H, NukeHooks>)
        return HostKind::Nuke;
    else if constexpr (std::is_same_v<H, BlenderHooks>)
        return HostKind::Blender;
    else if constexpr (std::is_same_v<H, MaxHooks>)
        return HostKind::Max;
    else if constexpr (std::is_same_v<H, UnrealHooks>)
        return HostKind::Unreal;
    else {
        static_assert(std::is_same_v<H, QtHooks>, "not a host hook table");
        return HostKind::Qt;
    }
}

template <typename H>
inline constexpr HostKind kHostKindOf = hostKindFor<H>();

[[nodiscard]] inline auto hostKindOf(HostHooks const& hooks) -> HostKind {
    return std::visit([](auto const& table) { return kHostKindOf<std::decay_t<decltype(table)>>; }, hooks);
}

[[nodiscard]] inline auto hostKindName(HostKind kind) -> std::string_view {
    switch (kind) {
    case HostKind::Maya:
        return "Maya";
    case HostKind::Houdini:
        return "Houdini";
    case HostKind::Nuke:
        return "Nuke";
    case HostKind::Blender:
        return "Blender";
    case HostKind::Max:
        return "Max";
    case HostKind::Unreal:
        return "Unreal";
    case HostKind::Qt:
        return "Qt";
    }
    return "Unknown";
}

} // namespace HD
