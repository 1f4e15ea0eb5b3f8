#include "registry/BackendSpec.hpp"

#include "backend/builtin/BlenderBackend.hpp"
#include "backend/builtin/FallbackBackend.hpp"
#include "backend/builtin/HoudiniBackend.hpp"
#include "backend/builtin/MaxBackend.hpp"
#include "backend/builtin/MayaBackend.hpp"
#include "backend/builtin/NukeBackend.hpp"
#include "backend/builtin/QtBackend.hpp"
#include "backend/builtin/UnrealBackend.hpp"

namespace HD {
namespace {

auto strip_suffix(std::string name, std::string_view suffix) -> std::string {
    if (name.size() > suffix.size() && name.ends_with(suffix))
        name.resize(name.size() - suffix.size());
    return name;
}

auto make_builtin(BuiltinBackend kind, BackendServices const& services) -> std::unique_ptr<DispatcherBackend> {
    switch (kind) {
    case BuiltinBackend::Maya:
        return std::make_unique<MayaBackend>(services);
    case BuiltinBackend::Houdini:
        return std::make_unique<HoudiniBackend>(services);
    case BuiltinBackend::Nuke:
        return std::make_unique<NukeBackend>(services);
    case BuiltinBackend::Blender:
        return std::make_unique<BlenderBackend>(services);
    case BuiltinBackend::Max:
        return std::make_unique<MaxBackend>(services);
    case BuiltinBackend::Unreal:
        return std::make_unique<UnrealBackend>(services);
    case BuiltinBackend::Qt:
        return std::make_unique<QtBackend>(services);
    case BuiltinBackend::Fallback:
        return std::make_unique<FallbackBackend>(services);
    }
    return nullptr;
}

} // namespace

auto builtinBackendName(BuiltinBackend kind) -> std::string_view {
    switch (kind) {
    case BuiltinBackend::Maya:
        return "Maya";
    case BuiltinBackend::Houdini:
        return "Houdini";
    case BuiltinBackend::Nuke:
        return "Nuke";
    case BuiltinBackend::Blender:
        return "Blender";
    case BuiltinBackend::Max:
        return "Max";
    case BuiltinBackend::Unreal:
        return "Unreal";
    case BuiltinBackend::Qt:
        return "Qt";
    case BuiltinBackend::Fallback:
        return "Fallback";
    }
    return "Unknown";
}

auto specDisplayName(BackendSpec const& spec, std::string_view explicitName) -> std::string {
    if (!explicitName.empty())
        return std::string{explicitName};
    if (auto const* builtin = std::get_if<BuiltinBackend>(&spec))
        return std::string{builtinBackendName(*builtin)};
    auto const& factory = std::get<std::shared_ptr<BackendFactory const>>(spec);
    if (!factory)
        return "<null factory>";
    return strip_suffix(strip_suffix(factory->name(), "Backend"), "Dispatcher");
}

auto instantiateSpec(BackendSpec const& spec, BackendServices const& services) -> std::unique_ptr<DispatcherBackend> {
    if (auto const* builtin = std::get_if<BuiltinBackend>(&spec))
        return make_builtin(*builtin, services);
    auto const& factory = std::get<std::shared_ptr<BackendFactory const>>(spec);
    if (!factory)
        return nullptr;
    return factory->create(services);
}

} // namespace HD
