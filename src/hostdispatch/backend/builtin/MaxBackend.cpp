#include "backend/builtin/MaxBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {
namespace {

constexpr char const* kNoQtWarning = "Max: Qt not available - executing function directly. This may cause thread safety issues.";

} // namespace

auto MaxBackend::isAvailable() const noexcept -> bool {
    try {
        return this->hooks<MaxHooks>().has_value();
    } catch (std::exception const& e) {
        hd_log("Max: availability probe failed: " + std::string{e.what()}, "Backend", "Debug");
        return false;
    }
}

auto MaxBackend::runDeferred(MainThreadTask task) -> std::optional<Error> {
    auto table = this->hooks<MaxHooks>();
    if (!table)
        return this->unavailable();
    if (table->singleShot == nullptr) {
        hd_log(kNoQtWarning, "Backend", "Warning");
        runDetached(task, this->name());
        return std::nullopt;
    }
    return this->postDeferred([&](HostCallback callback, void* data) { return table->singleShot(table->host, 0, callback, data); },
                              std::move(task));
}

auto MaxBackend::runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> {
    if (this->isMainThread())
        return runInline(task);
    auto table = this->hooks<MaxHooks>();
    if (!table)
        return this->unavailable();
    if (table->singleShot == nullptr) {
        hd_log(kNoQtWarning, "Backend", "Warning");
        return runInline(task);
    }
    return this->blockOnDeferred(std::move(task), timeout.value_or(this->services.syncTimeout));
}

auto MaxBackend::isMainThread() const -> bool {
    if (auto table = this->hooks<MaxHooks>(); table && table->isGuiThread != nullptr)
        return table->isGuiThread(table->host);
    return DispatcherBackend::isMainThread();
}

} // namespace HD
