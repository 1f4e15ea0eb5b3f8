#include "host/HostHooksTable.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace HD {

auto HostHooksTable::install(HostHooks hooks) -> void {
    auto const kind = hostKindOf(hooks);
    this->tables.insert_or_assign(kind, std::move(hooks));
    hd_log("HostHooksTable: installed " + std::string{hostKindName(kind)} + " primitives", "Host", "Debug");
}

auto HostHooksTable::uninstall(HostKind kind) -> bool {
    auto const erased = this->tables.erase(kind) > 0;
    if (erased) {
        hd_log("HostHooksTable: uninstalled " + std::string{hostKindName(kind)} + " primitives", "Host", "Debug");
    }
    return erased;
}

auto HostHooksTable::contains(HostKind kind) const -> bool {
    return this->tables.contains(kind);
}

auto HostHooksTable::installed() const -> std::vector<HostKind> {
    std::vector<HostKind> kinds;
    this->tables.for_each([&](auto const& entry) { kinds.push_back(entry.first); });
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

} // namespace HD
