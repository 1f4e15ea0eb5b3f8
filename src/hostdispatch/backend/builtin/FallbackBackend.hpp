#pragma once

#include "backend/DispatcherBackend.hpp"

namespace HD {

/**
 * Last resort: always available, runs everything directly on the calling
 * thread. It does not enforce thread affinity; off-main-thread calls are
 * logged as warnings.
 */
class FallbackBackend final : public DispatcherBackend {
public:
    using DispatcherBackend::DispatcherBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Fallback";
    }
    [[nodiscard]] auto isAvailable() const noexcept -> bool override {
        return true;
    }

    auto runDeferred(MainThreadTask task) -> std::optional<Error> override;
    auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error> override;

    [[nodiscard]] auto enforcesAffinity() const -> bool override {
        return false;
    }

private:
    auto warnIfOffMainThread() const -> void;
};

} // namespace HD
