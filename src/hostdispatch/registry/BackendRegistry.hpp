#pragma once

#include "core/Config.hpp"
#include "core/Error.hpp"
#include "registry/BackendSpec.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace HD {

// Higher priorities are tried first.
namespace DispatcherPriority {
inline constexpr int Maya          = 200;
inline constexpr int Houdini       = 190;
inline constexpr int Nuke          = 180;
inline constexpr int Blender       = 170;
inline constexpr int Max           = 160;
inline constexpr int Unreal        = 150;
inline constexpr int HostThreshold = 150; // entries at or above are host-specific
inline constexpr int Qt            = 100;
inline constexpr int Fallback      = 0;
} // namespace DispatcherPriority

struct RegistryEntry {
    int           priority = 0;
    BackendSpec   spec;
    std::string   displayName;
    std::uint64_t order = 0; // insertion order, tie-break for equal priorities
};

struct BackendListing {
    int         priority = 0;
    std::string name;
    bool        available = false;
};

/**
 * BackendRegistry: priority-ordered catalogue of dispatcher backends with a
 * cached resolution.
 *
 * - Built-in backends are seeded on first use (resolve/list/host queries),
 *   not at construction, so hosts that install their handshake late are
 *   still probed.
 * - Every mutation bumps a generation and drops the cached backend; a
 *   resolution that raced with a mutation does not publish its result.
 * - resolve() reads the cache without taking the catalogue lock.
 * - Availability is probed afresh on every resolution pass.
 */
class BackendRegistry {
public:
    explicit BackendRegistry(BackendServices services, std::string overrideEnv = kBackendOverrideEnv);

    BackendRegistry(BackendRegistry const&)                    = delete;
    auto operator=(BackendRegistry const&) -> BackendRegistry& = delete;

    // Updates priority/name in place when the spec is already registered.
    auto registerBackend(BackendSpec spec, int priority = 0, std::string name = {}) -> void;
    auto unregisterBackend(BackendSpec const& spec) -> bool;
    // Empties the catalogue; the next query re-seeds the built-ins.
    auto clear() -> void;
    // Drops the cached backend without touching the catalogue.
    auto invalidate() -> void;

    [[nodiscard]] auto resolve() -> Expected<std::shared_ptr<DispatcherBackend>>;
    [[nodiscard]] auto list() -> std::vector<BackendListing>;
    [[nodiscard]] auto isHostEnvironment() -> bool;
    [[nodiscard]] auto currentHostName() -> std::optional<std::string>;

    [[nodiscard]] auto entries() const -> std::vector<RegistryEntry>;
    [[nodiscard]] auto cachedBackendName() const -> std::optional<std::string>;
    [[nodiscard]] auto generation() const -> std::uint64_t;

private:
    auto seedLocked() -> void;
    // Seeds on first use and copies the catalogue under the same lock, so a
    // concurrent clear() never yields an unseeded, empty snapshot.
    auto seededSnapshot() -> std::pair<std::vector<RegistryEntry>, std::uint64_t>;
    auto registerLocked(BackendSpec spec, int priority, std::string name) -> void;
    auto mutatedLocked() -> void;
    auto snapshot() const -> std::pair<std::vector<RegistryEntry>, std::uint64_t>;
    auto probe(RegistryEntry const& entry) const -> std::unique_ptr<DispatcherBackend>;
    auto publish(std::shared_ptr<DispatcherBackend> backend, std::uint64_t seenGeneration) -> bool;

    BackendServices services;
    std::string     overrideEnv;

    mutable std::shared_mutex  catalogueMutex;
    std::vector<RegistryEntry> catalogue;
    bool                       builtinsSeeded = false;
    std::uint64_t              nextOrder      = 0;
    std::uint64_t              mutationCount  = 0;

    std::mutex                                     resolveMutex;
    std::atomic<std::shared_ptr<DispatcherBackend>> cached;
};

} // namespace HD
