#include "backend/builtin/FallbackBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace HD {

auto FallbackBackend::runDeferred(MainThreadTask task) -> std::optional<Error> {
    this->warnIfOffMainThread();
    runDetached(task, this->name());
    return std::nullopt;
}

auto FallbackBackend::runSync(MainThreadTask task, std::optional<std::chrono::milliseconds>) -> std::optional<Error> {
    this->warnIfOffMainThread();
    return runInline(task);
}

auto FallbackBackend::warnIfOffMainThread() const -> void {
    if (!this->isMainThread())
        hd_log("Fallback: no host backend available, executing directly off the main thread", "Backend", "Warning");
}

} // namespace HD
