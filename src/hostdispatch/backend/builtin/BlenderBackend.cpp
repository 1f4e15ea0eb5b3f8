#include "backend/builtin/BlenderBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {

auto BlenderBackend::isAvailable() const noexcept -> bool {
    try {
        auto table = this->hooks<BlenderHooks>();
        return table && table->registerTimer != nullptr;
    } catch (std::exception const& e) {
        hd_log("Blender: availability probe failed: " + std::string{e.what()}, "Backend", "Debug");
        return false;
    }
}

auto BlenderBackend::runDeferred(MainThreadTask task) -> std::optional<Error> {
    auto table = this->hooks<BlenderHooks>();
    if (!table || table->registerTimer == nullptr)
        return this->unavailable();
    return this->postDeferred(
            [&](HostCallback, void* data) { return table->registerTimer(table->host, &BlenderBackend::timerTrampoline, data, 0.0); },
            std::move(task));
}

auto BlenderBackend::runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> {
    if (this->isMainThread())
        return runInline(task);
    return this->blockOnDeferred(std::move(task), timeout.value_or(this->services.syncTimeout));
}

auto BlenderBackend::timerTrampoline(void* data) -> double {
    deferredTrampoline(data);
    return -1.0;
}

} // namespace HD
