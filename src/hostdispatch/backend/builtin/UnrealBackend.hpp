#pragma once

#include "backend/DispatcherBackend.hpp"

namespace HD {

/**
 * Unreal: work rides a Slate post-tick callback that unregisters itself after
 * its first call. There is no blocking game-thread primitive, so blocking
 * calls wait on a completion slot and are always bounded; a paused Slate tick
 * shows up as a timeout rather than a hang.
 */
class UnrealBackend final : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Unreal";
    }
    [[nodiscard]] auto isAvailable() const noexcept -> bool override;

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override;
    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override;

    // The game thread, as Unreal reports it.
    [[nodiscard]] auto isMainThread() const -> bool override;

private:
    static auto tickTrampoline(void* data, float deltaSeconds) -> bool;
};

} // namespace HD
