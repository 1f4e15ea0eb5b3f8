#pragma once

#include "backend/DispatcherBackend.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace HD {

enum class BuiltinBackend {
    Maya,
    Houdini,
    Nuke,
    Blender,
    Max,
    Unreal,
    Qt,
    Fallback
};

[[nodiscard]] auto builtinBackendName(BuiltinBackend kind) -> std::string_view;

/**
 * Extension point for backends the library does not ship. Registered by
 * shared_ptr; two specs are the same backend when they share the factory
 * object. create() is only called during resolution or listing.
 */
class BackendFactory {
public:
    virtual ~BackendFactory() = default;

    // Display name; a trailing "Backend" and then "Dispatcher" suffix are stripped.
    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto create(BackendServices const& services) const -> std::unique_ptr<DispatcherBackend> = 0;
};

using BackendSpec = std::variant<BuiltinBackend, std::shared_ptr<BackendFactory const>>;

// Explicit name if given, otherwise derived from the spec.
[[nodiscard]] auto specDisplayName(BackendSpec const& spec, std::string_view explicitName = {}) -> std::string;

[[nodiscard]] auto instantiateSpec(BackendSpec const& spec, BackendServices const& services) -> std::unique_ptr<DispatcherBackend>;

} // namespace HD
