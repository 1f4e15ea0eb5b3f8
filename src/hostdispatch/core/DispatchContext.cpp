#include "core/DispatchContext.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {

DispatchContext& DispatchContext::Instance() {
    // Leak-on-exit singleton: host plugins may still dispatch from atexit handlers.
    static DispatchContext* instance = []() -> DispatchContext* {
        return new DispatchContext();
    }();
    return *instance;
}

DispatchContext::DispatchContext()
    : DispatchContext(LoadDispatchConfig()) {}

DispatchContext::DispatchContext(DispatchConfig config, std::string overrideEnv)
    : config(config),
      backendRegistry(BackendServices{&this->hooksTable, &this->mainThread, &this->teardown, config.syncTimeout},
                      std::move(overrideEnv)) {}

auto DispatchContext::installHost(HostHooks hooks) -> void {
    auto const kind = hostKindOf(hooks);
    this->hooksTable.install(std::move(hooks));
    hd_log("Installed host primitives for " + std::string{hostKindName(kind)}, "Host");
    this->backendRegistry.invalidate();
}

auto DispatchContext::uninstallHost(HostKind kind) -> bool {
    if (!this->hooksTable.uninstall(kind))
        return false;
    hd_log("Uninstalled host primitives for " + std::string{hostKindName(kind)}, "Host");
    this->backendRegistry.invalidate();
    return true;
}

auto DispatchContext::beginShutdown() -> void {
    hd_log("Host teardown signalled", "Dispatch");
    this->teardown.begin();
}

auto DispatchContext::resetShutdown() -> void {
    this->teardown.reset();
}

auto DispatchContext::isShuttingDown() const -> bool {
    return this->teardown.requested();
}

auto DispatchContext::resolveBackend() -> Expected<std::shared_ptr<DispatcherBackend>> {
    return this->backendRegistry.resolve();
}

auto DispatchContext::services() -> BackendServices {
    return BackendServices{&this->hooksTable, &this->mainThread, &this->teardown, this->config.syncTimeout};
}

} // namespace HD
