#pragma once

#include <atomic>
#include <optional>
#include <thread>

namespace HD {

// True when the calling thread is the process's initial thread.
[[nodiscard]] auto isProcessInitialThread() -> bool;

/**
 * Default answer to "is this the main thread" for backends whose host does not
 * expose its own thread query. Embedders whose host main thread is not the
 * process's initial thread designate it explicitly.
 */
class MainThreadIdentity {
public:
    auto designate(std::thread::id id) -> void;
    auto designateCurrent() -> void;
    auto reset() -> void;

    [[nodiscard]] auto designated() const -> std::optional<std::thread::id>;
    [[nodiscard]] auto isCurrentThreadMain() const -> bool;

private:
    // A default-constructed id means "nothing designated".
    std::atomic<std::thread::id> designatedId{};
};

} // namespace HD
