#pragma once

#include "backend/DispatcherBackend.hpp"

namespace HD {

// Generic Qt application: zero-delay single-shot timers on the GUI thread.
class QtBackend final : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Qt";
    }
    [[nodiscard]] auto isAvailable() const noexcept -> bool override;

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override;
    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override;

    [[nodiscard]] auto isMainThread() const -> bool override;
};

} // namespace HD
