#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace HD {

class CompletionSlot;

/**
 * Host teardown flag plus the set of callers currently parked on the main
 * thread. begin() abandons every parked slot so waiters return immediately
 * instead of waiting on a loop that no longer services work.
 */
class TeardownSignal {
public:
    auto begin() -> void;
    auto reset() -> void;
    [[nodiscard]] auto requested() const -> bool;

    // Returns false (and does not attach) once teardown has begun.
    auto attach(std::shared_ptr<CompletionSlot> const& slot) -> bool;
    auto detach(CompletionSlot const* slot) -> void;

    [[nodiscard]] auto parkedCount() const -> std::size_t;

private:
    std::atomic<bool>                                                 flag{false};
    mutable std::mutex                                                mutex;
    std::unordered_map<CompletionSlot const*, std::weak_ptr<CompletionSlot>> parked;
};

} // namespace HD
