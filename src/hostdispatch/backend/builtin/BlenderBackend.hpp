#pragma once

#include "backend/DispatcherBackend.hpp"

namespace HD {

/**
 * Blender has no blocking main-thread primitive. Work is handed to a one-shot
 * application timer (the callback returns a negative interval to unregister)
 * and blocking calls park on a completion slot with a bounded wait.
 */
class BlenderBackend final : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Blender";
    }
    [[nodiscard]] auto isAvailable() const noexcept -> bool override;

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override;
    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override;

private:
    static auto timerTrampoline(void* data) -> double;
};

} // namespace HD
