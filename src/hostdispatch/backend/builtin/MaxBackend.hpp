#pragma once

#include "backend/DispatcherBackend.hpp"

namespace HD {

/**
 * 3ds Max runs a Qt event loop on its main thread. Work is posted through a
 * zero-delay single-shot timer; blocking calls wait on a completion slot the
 * timer callback settles.
 *
 * Max sessions without Qt still install the table (without singleShot) so the
 * backend is selected; calls then run directly on the caller with a warning.
 */
class MaxBackend final : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Max";
    }
    [[nodiscard]] auto isAvailable() const noexcept -> bool override;

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override;
    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override;

    [[nodiscard]] auto isMainThread() const -> bool override;
};

} // namespace HD
