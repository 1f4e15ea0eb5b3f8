#include "backend/builtin/QtBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {

auto QtBackend::isAvailable() const noexcept -> bool {
    try {
        auto table = this->hooks<QtHooks>();
        return table && table->singleShot != nullptr;
    } catch (std::exception const& e) {
        hd_log("Qt: availability probe failed: " + std::string{e.what()}, "Backend", "Debug");
        return false;
    }
}

auto QtBackend::runDeferred(MainThreadTask task) -> std::optional<Error> {
    auto table = this->hooks<QtHooks>();
    if (!table || table->singleShot == nullptr)
        return this->unavailable();
    return this->postDeferred([&](HostCallback callback, void* data) { return table->singleShot(table->host, 0, callback, data); },
                              std::move(task));
}

auto QtBackend::runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> {
    if (this->isMainThread())
        return runInline(task);
    return this->blockOnDeferred(std::move(task), timeout.value_or(this->services.syncTimeout));
}

auto QtBackend::isMainThread() const -> bool {
    if (auto table = this->hooks<QtHooks>(); table && table->isGuiThread != nullptr)
        return table->isGuiThread(table->host);
    return DispatcherBackend::isMainThread();
}

} // namespace HD
