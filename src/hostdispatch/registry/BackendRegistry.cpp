#include "registry/BackendRegistry.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace HD {
namespace {

struct BuiltinSeed {
    BuiltinBackend kind;
    int            priority;
};

constexpr auto kBuiltinSeeds = std::to_array<BuiltinSeed>({
        {BuiltinBackend::Maya, DispatcherPriority::Maya},
        {BuiltinBackend::Houdini, DispatcherPriority::Houdini},
        {BuiltinBackend::Nuke, DispatcherPriority::Nuke},
        {BuiltinBackend::Blender, DispatcherPriority::Blender},
        {BuiltinBackend::Max, DispatcherPriority::Max},
        {BuiltinBackend::Unreal, DispatcherPriority::Unreal},
        {BuiltinBackend::Qt, DispatcherPriority::Qt},
        {BuiltinBackend::Fallback, DispatcherPriority::Fallback},
});

auto sort_catalogue(std::vector<RegistryEntry>& catalogue) -> void {
    std::sort(catalogue.begin(), catalogue.end(), [](RegistryEntry const& lhs, RegistryEntry const& rhs) {
        if (lhs.priority != rhs.priority)
            return lhs.priority > rhs.priority;
        return lhs.order < rhs.order;
    });
}

} // namespace

BackendRegistry::BackendRegistry(BackendServices services, std::string overrideEnv)
    : services(services), overrideEnv(std::move(overrideEnv)) {}

auto BackendRegistry::registerBackend(BackendSpec spec, int priority, std::string name) -> void {
    std::unique_lock lock(this->catalogueMutex);
    this->registerLocked(std::move(spec), priority, std::move(name));
    this->mutatedLocked();
}

auto BackendRegistry::registerLocked(BackendSpec spec, int priority, std::string name) -> void {
    auto displayName = specDisplayName(spec, name);
    auto existing    = std::find_if(this->catalogue.begin(), this->catalogue.end(), [&](RegistryEntry const& entry) {
        return entry.spec == spec;
    });
    if (existing != this->catalogue.end()) {
        existing->priority    = priority;
        existing->displayName = displayName;
        sort_catalogue(this->catalogue);
        hd_log("Updated dispatcher backend " + displayName + " with priority " + std::to_string(priority), "Registry", "Debug");
        return;
    }
    this->catalogue.push_back(RegistryEntry{priority, std::move(spec), displayName, this->nextOrder++});
    sort_catalogue(this->catalogue);
    hd_log("Registered dispatcher backend " + displayName + " with priority " + std::to_string(priority), "Registry", "Debug");
}

auto BackendRegistry::unregisterBackend(BackendSpec const& spec) -> bool {
    std::unique_lock lock(this->catalogueMutex);
    auto             existing = std::find_if(this->catalogue.begin(), this->catalogue.end(), [&](RegistryEntry const& entry) {
        return entry.spec == spec;
    });
    if (existing == this->catalogue.end())
        return false;
    hd_log("Unregistered dispatcher backend " + existing->displayName, "Registry", "Debug");
    this->catalogue.erase(existing);
    this->mutatedLocked();
    return true;
}

auto BackendRegistry::clear() -> void {
    std::unique_lock lock(this->catalogueMutex);
    this->catalogue.clear();
    this->builtinsSeeded = false;
    this->mutatedLocked();
}

auto BackendRegistry::invalidate() -> void {
    std::unique_lock lock(this->catalogueMutex);
    this->mutatedLocked();
}

auto BackendRegistry::mutatedLocked() -> void {
    ++this->mutationCount;
    this->cached.store(nullptr, std::memory_order_release);
}

auto BackendRegistry::seedLocked() -> void {
    if (this->builtinsSeeded)
        return;
    this->builtinsSeeded = true;
    // A built-in registered earlier is reset to its default priority and name.
    for (auto const& seed : kBuiltinSeeds)
        this->registerLocked(BackendSpec{seed.kind}, seed.priority, std::string{builtinBackendName(seed.kind)});
    this->mutatedLocked();
}

auto BackendRegistry::seededSnapshot() -> std::pair<std::vector<RegistryEntry>, std::uint64_t> {
    {
        std::shared_lock lock(this->catalogueMutex);
        if (this->builtinsSeeded)
            return {this->catalogue, this->mutationCount};
    }
    std::unique_lock lock(this->catalogueMutex);
    this->seedLocked();
    return {this->catalogue, this->mutationCount};
}

auto BackendRegistry::snapshot() const -> std::pair<std::vector<RegistryEntry>, std::uint64_t> {
    std::shared_lock lock(this->catalogueMutex);
    return {this->catalogue, this->mutationCount};
}

auto BackendRegistry::probe(RegistryEntry const& entry) const -> std::unique_ptr<DispatcherBackend> {
    try {
        auto backend = instantiateSpec(entry.spec, this->services);
        if (!backend) {
            hd_log("Backend " + entry.displayName + " could not be instantiated", "Registry", "Warning");
            return nullptr;
        }
        if (!backend->isAvailable())
            return nullptr;
        return backend;
    } catch (std::exception const& e) {
        hd_log("Failed to initialize " + entry.displayName + ": " + e.what(), "Registry", "Warning");
        return nullptr;
    }
}

auto BackendRegistry::publish(std::shared_ptr<DispatcherBackend> backend, std::uint64_t seenGeneration) -> bool {
    std::shared_lock lock(this->catalogueMutex);
    if (this->mutationCount != seenGeneration)
        return false;
    this->cached.store(std::move(backend), std::memory_order_release);
    return true;
}

auto BackendRegistry::resolve() -> Expected<std::shared_ptr<DispatcherBackend>> {
    if (auto backend = this->cached.load(std::memory_order_acquire))
        return backend;

    std::lock_guard resolveLock(this->resolveMutex);
    if (auto backend = this->cached.load(std::memory_order_acquire))
        return backend;

    auto [entries, seenGeneration] = this->seededSnapshot();

    if (auto wanted = ReadBackendOverride(this->overrideEnv)) {
        auto match = std::find_if(entries.begin(), entries.end(), [&](RegistryEntry const& entry) {
            return ToLower(entry.displayName) == *wanted;
        });
        if (match == entries.end()) {
            hd_log("Environment-specified backend '" + *wanted + "' matches no registered backend; using priority order",
                   "Registry", "Warning");
        } else if (auto backend = this->probe(*match)) {
            hd_log("Using dispatcher backend from environment: " + match->displayName + " (priority="
                           + std::to_string(match->priority) + ")",
                   "Registry", "Info");
            std::shared_ptr<DispatcherBackend> shared{std::move(backend)};
            this->publish(shared, seenGeneration);
            return shared;
        } else {
            hd_log("Environment-specified backend '" + *wanted + "' is not available; using priority order", "Registry",
                   "Warning");
        }
    }

    for (auto const& entry : entries) {
        if (auto backend = this->probe(entry)) {
            hd_log("Selected dispatcher backend: " + entry.displayName + " (priority=" + std::to_string(entry.priority) + ")",
                   "Registry", "Debug");
            std::shared_ptr<DispatcherBackend> shared{std::move(backend)};
            this->publish(shared, seenGeneration);
            return shared;
        }
    }

    hd_log("No thread dispatcher backend available", "Registry", "Error");
    return std::unexpected(Error{Error::Code::NoBackend, "No thread dispatcher backend available"});
}

auto BackendRegistry::list() -> std::vector<BackendListing> {
    auto const entries = this->seededSnapshot().first;
    std::vector<BackendListing> listing;
    listing.reserve(entries.size());
    for (auto const& entry : entries) {
        listing.push_back(BackendListing{entry.priority, entry.displayName, this->probe(entry) != nullptr});
    }
    return listing;
}

auto BackendRegistry::currentHostName() -> std::optional<std::string> {
    auto const entries = this->seededSnapshot().first;
    for (auto const& entry : entries) {
        // Sorted by descending priority: everything after this is generic.
        if (entry.priority < DispatcherPriority::HostThreshold)
            break;
        if (this->probe(entry)) {
            hd_log("Host environment detected: " + entry.displayName, "Registry", "Debug");
            return entry.displayName;
        }
    }
    return std::nullopt;
}

auto BackendRegistry::isHostEnvironment() -> bool {
    return this->currentHostName().has_value();
}

auto BackendRegistry::entries() const -> std::vector<RegistryEntry> {
    return this->snapshot().first;
}

auto BackendRegistry::cachedBackendName() const -> std::optional<std::string> {
    if (auto backend = this->cached.load(std::memory_order_acquire))
        return backend->name();
    return std::nullopt;
}

auto BackendRegistry::generation() const -> std::uint64_t {
    return this->snapshot().second;
}

} // namespace HD
