#pragma once

#include "core/DispatchContext.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace HD::Diagnostics {

inline auto backendListingToJson(BackendListing const& listing) -> nlohmann::json {
    return nlohmann::json{{"name", listing.name}, {"priority", listing.priority}, {"available", listing.available}};
}

inline auto installedHostsToJson(HostHooksTable const& hosts) -> nlohmann::json {
    auto json = nlohmann::json::array();
    for (auto kind : hosts.installed())
        json.push_back(std::string{hostKindName(kind)});
    return json;
}

// Probes every registered backend; does not resolve or touch the cache.
inline auto dispatchStateToJson(DispatchContext& context) -> nlohmann::json {
    auto backends = nlohmann::json::array();
    for (auto const& listing : context.registry().list())
        backends.push_back(backendListingToJson(listing));

    nlohmann::json state{{"backends", std::move(backends)},
                         {"installed_hosts", installedHostsToJson(context.hosts())},
                         {"shutting_down", context.isShuttingDown()},
                         {"sync_timeout_ms", context.syncTimeout().count()},
                         {"registry_generation", context.registry().generation()}};
    auto cached = context.registry().cachedBackendName();
    state["cached_backend"] = cached ? nlohmann::json(*cached) : nlohmann::json(nullptr);
    auto host = context.registry().currentHostName();
    state["host_environment"] = host ? nlohmann::json(*host) : nlohmann::json(nullptr);
    return state;
}

} // namespace HD::Diagnostics
