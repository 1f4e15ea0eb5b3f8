#include "backend/builtin/UnrealBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {

auto UnrealBackend::isAvailable() const noexcept -> bool {
    try {
        auto table = this->hooks<UnrealHooks>();
        return table && table->registerSlatePostTickCallback != nullptr;
    } catch (std::exception const& e) {
        hd_log("Unreal: availability probe failed: " + std::string{e.what()}, "Backend", "Debug");
        return false;
    }
}

auto UnrealBackend::runDeferred(MainThreadTask task) -> std::optional<Error> {
    auto table = this->hooks<UnrealHooks>();
    if (!table || table->registerSlatePostTickCallback == nullptr)
        return this->unavailable();
    return this->postDeferred(
            [&](HostCallback, void* data) {
                return table->registerSlatePostTickCallback(table->host, &UnrealBackend::tickTrampoline, data);
            },
            std::move(task));
}

auto UnrealBackend::runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> {
    if (this->isMainThread())
        return runInline(task);
    return this->blockOnDeferred(std::move(task), timeout.value_or(this->services.syncTimeout));
}

auto UnrealBackend::isMainThread() const -> bool {
    if (auto table = this->hooks<UnrealHooks>(); table && table->isGameThread != nullptr)
        return table->isGameThread(table->host);
    return DispatcherBackend::isMainThread();
}

auto UnrealBackend::tickTrampoline(void* data, float) -> bool {
    deferredTrampoline(data);
    return false;
}

} // namespace HD
