#pragma once

#include "backend/DispatcherBackend.hpp"
#include "log/TaggedLogger.hpp"

namespace HD {

/**
 * Shared shape of hosts that ship both a deferred-call queue and a blocking
 * call-with-result primitive (Maya, Houdini, Nuke). `Deferred` and `Blocking`
 * name the two entry points inside the host's hook table.
 *
 * Bounded waits never go through the native blocking primitive, which cannot
 * be abandoned once entered; they use the deferred queue plus a completion slot.
 */
template <typename H, auto Deferred, auto Blocking>
class NativeBlockingBackend : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto isAvailable() const noexcept -> bool override {
        try {
            auto table = this->template hooks<H>();
            return table && (*table).*Deferred != nullptr && (*table).*Blocking != nullptr;
        } catch (std::exception const& e) {
            hd_log(this->name() + ": availability probe failed: " + e.what(), "Backend", "Debug");
            return false;
        }
    }

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override {
        auto table = this->template hooks<H>();
        if (!table || (*table).*Deferred == nullptr)
            return this->unavailable();
        auto const primitive = (*table).*Deferred;
        return this->postDeferred([&](HostCallback callback, void* data) { return primitive(table->host, callback, data); },
                                  std::move(task));
    }

    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override {
        if (this->isMainThread())
            return runInline(task);
        if (timeout)
            return this->blockOnDeferred(std::move(task), timeout);
        auto table = this->template hooks<H>();
        if (!table || (*table).*Blocking == nullptr)
            return this->unavailable();
        auto const primitive = (*table).*Blocking;
        return this->blockOnNative([&](HostCallback callback, void* data) { return primitive(table->host, callback, data); },
                                   std::move(task));
    }

    [[nodiscard]] auto hasNativeBlocking() const -> bool override {
        return true;
    }
};

} // namespace HD
