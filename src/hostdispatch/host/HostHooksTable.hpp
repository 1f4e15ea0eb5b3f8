#pragma once

#include <hostdispatch/HostHooks.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace HD {

/**
 * Installed host primitive tables, keyed by host.
 *
 * Backends look their table up on every probe and dispatch, so a host that
 * uninstalls during teardown is seen as unavailable immediately. Lookups copy
 * the table out under the shard lock; callers never hold a reference into
 * the map.
 */
class HostHooksTable {
public:
    // Replaces any table already installed for the same host.
    auto install(HostHooks hooks) -> void;
    auto uninstall(HostKind kind) -> bool;

    [[nodiscard]] auto contains(HostKind kind) const -> bool;
    [[nodiscard]] auto installed() const -> std::vector<HostKind>;

    template <typename H>
    [[nodiscard]] auto lookup() const -> std::optional<H> {
        std::optional<H> found;
        this->tables.if_contains(kHostKindOf<H>, [&](auto const& entry) {
            if (auto const* table = std::get_if<H>(&entry.second)) {
                found = *table;
            }
        });
        return found;
    }

private:
    struct KindHash {
        auto operator()(HostKind kind) const noexcept -> std::size_t {
            return static_cast<std::size_t>(kind);
        }
    };

    using Map = phmap::parallel_flat_hash_map<HostKind,
                                              HostHooks,
                                              KindHash,
                                              std::equal_to<HostKind>,
                                              std::allocator<std::pair<const HostKind, HostHooks>>,
                                              4,
                                              std::mutex>;

    Map tables;
};

} // namespace HD
