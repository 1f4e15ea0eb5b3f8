#pragma once

#include "core/Config.hpp"
#include "core/MainThreadIdentity.hpp"
#include "core/TeardownSignal.hpp"
#include "host/HostHooksTable.hpp"
#include "registry/BackendRegistry.hpp"

#include <hostdispatch/HostHooks.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace HD {

/**
 * DispatchContext: everything the dispatcher keeps per process: the host
 * handshake table, the main-thread identity, the teardown flag and the
 * backend registry built on top of them.
 *
 * Instance() is the context the free functions use. Tests construct their
 * own to stay isolated from each other and from the environment.
 */
class DispatchContext {
public:
    DispatchContext();
    explicit DispatchContext(DispatchConfig config, std::string overrideEnv = kBackendOverrideEnv);

    static DispatchContext& Instance();

    DispatchContext(DispatchContext const&)                    = delete;
    auto operator=(DispatchContext const&) -> DispatchContext& = delete;

    // A host plugin announces its primitives; replaces an earlier table for the same host.
    auto installHost(HostHooks hooks) -> void;
    auto uninstallHost(HostKind kind) -> bool;

    // Releases parked blocking callers; later dispatches fail fast.
    auto beginShutdown() -> void;
    auto resetShutdown() -> void;
    [[nodiscard]] auto isShuttingDown() const -> bool;

    [[nodiscard]] auto resolveBackend() -> Expected<std::shared_ptr<DispatcherBackend>>;

    auto registry() -> BackendRegistry& {
        return this->backendRegistry;
    }
    auto hosts() const -> HostHooksTable const& {
        return this->hooksTable;
    }
    auto identity() -> MainThreadIdentity& {
        return this->mainThread;
    }
    auto teardownSignal() -> TeardownSignal& {
        return this->teardown;
    }
    auto services() -> BackendServices;
    auto syncTimeout() const -> std::chrono::milliseconds {
        return this->config.syncTimeout;
    }

private:
    // Declaration order matters: the registry keeps pointers to the members above it.
    HostHooksTable     hooksTable;
    MainThreadIdentity mainThread;
    TeardownSignal     teardown;
    DispatchConfig     config;
    BackendRegistry    backendRegistry;
};

} // namespace HD
